#include "domain/navigation_problem.hh"

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>
#include <utility>

#include "common/check.hh"

namespace sentinel::domain {
namespace {
constexpr std::array<Action, 4> MOVEMENT_ACTIONS = {Action::UP, Action::DOWN, Action::LEFT,
                                                    Action::RIGHT};
}  // namespace

TargetSet::TargetSet(std::initializer_list<Position> members)
    : TargetSet(std::vector<Position>(members)) {}

TargetSet::TargetSet(std::vector<Position> members) : members_(std::move(members)) {
    std::sort(members_.begin(), members_.end());
    members_.erase(std::unique(members_.begin(), members_.end()), members_.end());
}

bool TargetSet::contains(const Position &pos) const {
    return std::binary_search(members_.begin(), members_.end(), pos);
}

TargetSet TargetSet::without(const Position &pos) const {
    TargetSet out;
    out.members_.reserve(members_.size());
    std::copy_if(members_.begin(), members_.end(), std::back_inserter(out.members_),
                 [&pos](const Position &member) { return !(member == pos); });
    return out;
}

bool NavigationState::operator==(const NavigationState &other) const {
    return position == other.position && battery == other.battery && targets == other.targets;
}

NavigationProblem::NavigationProblem(NavigationState initial, Position goal, GridConfig config)
    : initial_(std::move(initial)), goal_(goal), config_(std::move(config)) {
    validate(config_);
    SENTINEL_CHECK(in_bounds(config_, initial_.position), "Initial position is outside the grid",
                   initial_.position.x, initial_.position.y);
    SENTINEL_CHECK(in_bounds(config_, goal_), "Goal is outside the grid", goal_.x, goal_.y);
}

std::vector<Action> NavigationProblem::actions(const NavigationState &state) const {
    std::vector<Action> out;
    if (state.battery <= 0) {
        return out;
    }

    for (const Action action : MOVEMENT_ACTIONS) {
        const Position destination = displaced(state.position, action);
        if (in_bounds(config_, destination) && !is_obstacle(config_, destination)) {
            out.push_back(action);
        }
    }
    return out;
}

NavigationState NavigationProblem::result(const NavigationState &state,
                                          const Action &action) const {
    const Position destination = displaced(state.position, action);
    return NavigationState{
        .position = destination,
        .battery = state.battery - step_cost(config_, destination),
        .targets = state.targets.without(destination),
    };
}

bool NavigationProblem::goal_test(const NavigationState &state) const {
    return state.targets.empty() && state.position == goal_ && state.battery >= 0;
}

double NavigationProblem::path_cost(const double cost, const NavigationState &,
                                    const Action &, const NavigationState &state_2) const {
    return cost + step_cost(config_, state_2.position);
}

double NavigationProblem::h(const NavigationState &state) const {
    if (state.targets.empty()) {
        return wind_adjusted_distance(config_, state.position, goal_);
    }

    // Optimistically assume only the closest target needs to be visited before the base
    double best_estimate = std::numeric_limits<double>::max();
    for (const Position &target : state.targets) {
        const double estimate = wind_adjusted_distance(config_, state.position, target) +
                                wind_adjusted_distance(config_, target, goal_);
        best_estimate = std::min(best_estimate, estimate);
    }
    return best_estimate;
}

}  // namespace sentinel::domain
