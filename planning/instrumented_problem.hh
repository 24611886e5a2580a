#pragma once

#include <vector>

#include "planning/search_problem.hh"

namespace sentinel::planning {

// Wraps a search problem and counts how many nodes a search procedure expands. Every call is
// forwarded to the wrapped problem unchanged; the only side effect is that each call to actions()
// increments the expansion counter. initial() and goal() return references into the wrapped
// problem, so rebinding them through the wrapper rebinds the wrapped problem.
template <SearchProblem P>
class InstrumentedProblem {
   public:
    using State = typename P::State;
    using Action = typename P::Action;
    using Goal = typename P::Goal;

    explicit InstrumentedProblem(P &problem) : problem_(&problem), num_expanded_(0) {}

    std::vector<Action> actions(const State &state) {
        num_expanded_++;
        return problem_->actions(state);
    }

    State result(const State &state, const Action &action) {
        return problem_->result(state, action);
    }

    bool goal_test(const State &state) { return problem_->goal_test(state); }

    double path_cost(const double cost, const State &state_1, const Action &action,
                     const State &state_2) {
        return problem_->path_cost(cost, state_1, action, state_2);
    }

    double h(const State &state) { return problem_->h(state); }

    State &initial() { return problem_->initial(); }
    Goal &goal() { return problem_->goal(); }

    int num_expanded() const { return num_expanded_; }
    void reset() { num_expanded_ = 0; }

    const P &wrapped() const { return *problem_; }

   private:
    P *problem_;
    int num_expanded_;
};

}  // namespace sentinel::planning
