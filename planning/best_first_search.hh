#pragma once

#include <algorithm>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

#include "planning/search_problem.hh"

namespace sentinel::planning {
namespace detail {

// Graph search that always expands the open node with the lowest priority. The priority of a node
// is computed by PriorityFunc, which must have the interface:
//     double(const double cost_to_come, const double est_cost_to_go)
// The goal test is applied when a node is expanded, not when it is generated.
template <SearchProblem P, typename PriorityFunc>
std::optional<SearchResult<P>> best_first_search(P &problem, const PriorityFunc &priority_func) {
    using State = typename P::State;
    using Action = typename P::Action;

    struct Node {
        State state;
        std::optional<int> maybe_parent_idx;
        std::optional<Action> maybe_action;
        double cost_to_come;
        double priority;
        bool should_skip;
    };
    struct Compare {
        const std::vector<Node> *nodes;
        bool operator()(const int a, const int b) const {
            // This operator should return true if a should be expanded after b;
            const auto &node_a = nodes->at(a);
            const auto &node_b = nodes->at(b);
            if (node_a.priority == node_b.priority) {
                // If the priorities are equal, prefer the one that has travelled further.
                return node_a.cost_to_come < node_b.cost_to_come;
            }
            return node_a.priority > node_b.priority;
        }
    };

    const auto extract_result = [](const int end_idx, const std::vector<Node> &nodes,
                                   const int num_nodes_expanded) {
        SearchResult<P> out{
            .states = {},
            .actions = {},
            .cost = nodes.at(end_idx).cost_to_come,
            .num_nodes_expanded = num_nodes_expanded,
            .num_nodes_visited = static_cast<int>(nodes.size()),
        };
        for (std::optional<int> node_idx = end_idx; node_idx.has_value();
             node_idx = nodes.at(node_idx.value()).maybe_parent_idx) {
            const auto &node = nodes.at(node_idx.value());
            out.states.push_back(node.state);
            if (node.maybe_action.has_value()) {
                out.actions.push_back(node.maybe_action.value());
            }
        }
        std::reverse(out.states.begin(), out.states.end());
        std::reverse(out.actions.begin(), out.actions.end());
        return out;
    };

    const State initial_state = problem.initial();
    std::vector<Node> nodes;
    nodes.push_back(Node{
        .state = initial_state,
        .maybe_parent_idx = std::nullopt,
        .maybe_action = std::nullopt,
        .cost_to_come = 0.0,
        .priority = priority_func(0.0, problem.h(initial_state)),
        .should_skip = false,
    });

    std::priority_queue<int, std::vector<int>, Compare> queue(Compare{.nodes = &nodes});
    queue.push(0);
    std::unordered_map<State, int> open_idx_from_state{{initial_state, 0}};
    std::unordered_map<State, double> expanded_nodes;
    int nodes_expanded = 0;
    while (!queue.empty()) {
        const int node_idx = queue.top();
        queue.pop();
        if (nodes.at(node_idx).should_skip) {
            // A cheaper copy of this state was queued after this one
            continue;
        }

        // nodes.push_back() can re-alloc, so keep copies instead of a reference
        const State curr_state = nodes.at(node_idx).state;
        const double curr_cost_to_come = nodes.at(node_idx).cost_to_come;
        open_idx_from_state.erase(curr_state);

        nodes_expanded++;
        expanded_nodes[curr_state] = curr_cost_to_come;

        if (problem.goal_test(curr_state)) {
            return extract_result(node_idx, nodes, nodes_expanded);
        }

        for (const Action &action : problem.actions(curr_state)) {
            State next_state = problem.result(curr_state, action);
            const double cost_to_come =
                problem.path_cost(curr_cost_to_come, curr_state, action, next_state);

            auto in_expanded_iter = expanded_nodes.find(next_state);
            if (in_expanded_iter != expanded_nodes.end()) {
                if (in_expanded_iter->second <= cost_to_come) {
                    continue;
                }
                // Remove the existing element from the closed list
                expanded_nodes.erase(in_expanded_iter);
            }

            // If the state is already waiting in the open set and the new copy isn't cheaper,
            // drop the new copy. Otherwise the queued copy gets skipped when it is popped.
            auto in_open_iter = open_idx_from_state.find(next_state);
            if (in_open_iter != open_idx_from_state.end()) {
                Node &queued = nodes.at(in_open_iter->second);
                if (queued.cost_to_come <= cost_to_come) {
                    continue;
                }
                queued.should_skip = true;
            }

            const double est_cost_to_go = problem.h(next_state);
            nodes.push_back(Node{
                .state = std::move(next_state),
                .maybe_parent_idx = node_idx,
                .maybe_action = action,
                .cost_to_come = cost_to_come,
                .priority = priority_func(cost_to_come, est_cost_to_go),
                .should_skip = false,
            });
            const int new_idx = static_cast<int>(nodes.size()) - 1;
            open_idx_from_state[nodes.back().state] = new_idx;
            queue.push(new_idx);
        }
    }
    return std::nullopt;
}
}  // namespace detail

// A* search. Returns the cheapest path to a goal state when problem.h never overestimates.
template <SearchProblem P>
std::optional<SearchResult<P>> a_star_search(P &problem) {
    return detail::best_first_search(
        problem, [](const double cost_to_come, const double est_cost_to_go) {
            return cost_to_come + est_cost_to_go;
        });
}

// Greedy best first search. Orders the frontier by problem.h alone, so the path it returns is
// not necessarily the cheapest one.
template <SearchProblem P>
std::optional<SearchResult<P>> greedy_best_first_search(P &problem) {
    return detail::best_first_search(
        problem, [](const double, const double est_cost_to_go) { return est_cost_to_go; });
}

}  // namespace sentinel::planning
