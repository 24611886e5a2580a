#pragma once

#include <algorithm>
#include <deque>
#include <optional>
#include <unordered_set>
#include <vector>

#include "planning/search_problem.hh"

namespace sentinel::planning {

// Breadth first graph search. States are goal tested as soon as they are generated, and every
// state is queued at most once. The returned path has the fewest actions, which is the cheapest
// path only when every step costs the same.
template <SearchProblem P>
std::optional<SearchResult<P>> breadth_first_search(P &problem) {
    using State = typename P::State;
    using Action = typename P::Action;

    struct Node {
        State state;
        std::optional<int> maybe_parent_idx;
        std::optional<Action> maybe_action;
        double cost;
    };

    int nodes_expanded = 0;
    int nodes_visited = 0;

    const auto extract_result = [&nodes_expanded, &nodes_visited](const int end_idx,
                                                                  const std::vector<Node> &nodes) {
        SearchResult<P> out{
            .states = {},
            .actions = {},
            .cost = nodes.at(end_idx).cost,
            .num_nodes_expanded = nodes_expanded,
            .num_nodes_visited = nodes_visited,
        };
        for (std::optional<int> node_idx = end_idx; node_idx.has_value();
             node_idx = nodes.at(node_idx.value()).maybe_parent_idx) {
            const auto &node = nodes.at(node_idx.value());
            out.states.push_back(node.state);
            if (node.maybe_action.has_value()) {
                out.actions.push_back(node.maybe_action.value());
            }
        }
        // Reverse so that the first element is the initial state and the last is the goal
        std::reverse(out.states.begin(), out.states.end());
        std::reverse(out.actions.begin(), out.actions.end());
        return out;
    };

    std::vector<Node> nodes = {{.state = problem.initial(),
                                .maybe_parent_idx = std::nullopt,
                                .maybe_action = std::nullopt,
                                .cost = 0.0}};
    if (problem.goal_test(nodes.front().state)) {
        return extract_result(0, nodes);
    }

    // Holds every state that is either expanded or waiting in the queue
    std::unordered_set<State> seen = {nodes.front().state};
    std::deque<int> node_idx_queue = {0};
    while (!node_idx_queue.empty()) {
        const int node_idx = node_idx_queue.front();
        node_idx_queue.pop_front();
        // Make a copy to avoid invalidated references when pushing back on nodes
        const Node n = nodes.at(node_idx);
        nodes_expanded++;

        for (const Action &action : problem.actions(n.state)) {
            State next_state = problem.result(n.state, action);
            nodes_visited++;
            if (seen.contains(next_state)) {
                continue;
            }
            seen.insert(next_state);

            const double cost = problem.path_cost(n.cost, n.state, action, next_state);
            nodes.push_back(Node{
                .state = std::move(next_state),
                .maybe_parent_idx = node_idx,
                .maybe_action = action,
                .cost = cost,
            });
            const int new_idx = static_cast<int>(nodes.size()) - 1;
            if (problem.goal_test(nodes.back().state)) {
                return extract_result(new_idx, nodes);
            }
            node_idx_queue.push_back(new_idx);
        }
    }
    return std::nullopt;
}
}  // namespace sentinel::planning
