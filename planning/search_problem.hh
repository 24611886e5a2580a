#pragma once

#include <concepts>
#include <functional>
#include <vector>

namespace sentinel::planning {

// A search problem exposes the state space that the procedures in this directory explore.
// It must provide:
//     State, Action, Goal                         -- member types; State must be hashable
//     State &initial() / Goal &goal()             -- mutable, so callers may rebind them
//     std::vector<Action> actions(const State &)  -- called exactly once per expanded node
//     State result(const State &, const Action &)
//     bool goal_test(const State &)
//     double path_cost(double c, const State &s1, const Action &a, const State &s2)
//         -- cost of reaching s2 given that s1 was reached with cost c
//     double h(const State &)                     -- estimated cost to go
template <typename P>
concept SearchProblem = requires(P problem, const typename P::State &state,
                                 const typename P::Action &action, const double cost) {
    { problem.initial() } -> std::convertible_to<typename P::State>;
    problem.goal();
    { problem.actions(state) } -> std::same_as<std::vector<typename P::Action>>;
    { problem.result(state, action) } -> std::convertible_to<typename P::State>;
    { problem.goal_test(state) } -> std::convertible_to<bool>;
    { problem.path_cost(cost, state, action, state) } -> std::convertible_to<double>;
    { problem.h(state) } -> std::convertible_to<double>;
    { std::hash<typename P::State>{}(state) } -> std::convertible_to<std::size_t>;
};

template <typename P>
struct SearchResult {
    // states.front() is the initial state and states.back() satisfies the goal test.
    // actions.at(i) takes states.at(i) to states.at(i + 1).
    std::vector<typename P::State> states;
    std::vector<typename P::Action> actions;
    double cost;
    int num_nodes_expanded;
    int num_nodes_visited;
};

}  // namespace sentinel::planning
