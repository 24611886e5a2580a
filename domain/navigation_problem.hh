#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

#include "domain/grid_world.hh"

namespace sentinel::domain {

// A set of target cells with a canonical representation: members are kept sorted and unique,
// so two sets holding the same cells compare and hash equal regardless of insertion order.
class TargetSet {
   public:
    TargetSet() = default;
    TargetSet(std::initializer_list<Position> members);
    explicit TargetSet(std::vector<Position> members);

    bool contains(const Position &pos) const;
    // Returns a copy with pos removed. Returns an equal copy if pos isn't a member.
    TargetSet without(const Position &pos) const;

    bool empty() const { return members_.empty(); }
    int size() const { return static_cast<int>(members_.size()); }
    const std::vector<Position> &members() const { return members_; }
    std::vector<Position>::const_iterator begin() const { return members_.begin(); }
    std::vector<Position>::const_iterator end() const { return members_.end(); }

    bool operator==(const TargetSet &other) const { return members_ == other.members_; }

   private:
    std::vector<Position> members_;
};

struct NavigationState {
    Position position;
    // May be negative in states produced by result(); such states never pass the goal test.
    int battery;
    TargetSet targets;

    bool operator==(const NavigationState &other) const;
};

// One leg of a mission posed as a search problem. The agent starts at initial().position with
// initial().battery units of energy, must pass over every cell in initial().targets and finish on
// goal(), the leg's base. Moving onto an urban cell costs URBAN_STEP_COST, any other cell costs
// NATURAL_STEP_COST.
class NavigationProblem {
   public:
    using State = NavigationState;
    using Action = domain::Action;
    using Goal = Position;

    NavigationProblem(NavigationState initial, Position goal, GridConfig config);

    // The movement actions that keep the agent inside the grid and off obstacles, in the order
    // UP, DOWN, LEFT, RIGHT. Empty once the battery is exhausted.
    std::vector<Action> actions(const NavigationState &state) const;

    // Moves the agent, charges the step cost of the destination and collects a target found
    // there.
    NavigationState result(const NavigationState &state, const Action &action) const;

    bool goal_test(const NavigationState &state) const;

    double path_cost(const double cost, const NavigationState &state_1, const Action &action,
                     const NavigationState &state_2) const;

    // Wind adjusted Manhattan estimate of the cost to finish the leg. With targets pending, this
    // is the cheapest estimate over going to a single target and then to the base.
    double h(const NavigationState &state) const;

    NavigationState &initial() { return initial_; }
    const NavigationState &initial() const { return initial_; }
    Position &goal() { return goal_; }
    const Position &goal() const { return goal_; }
    const GridConfig &config() const { return config_; }

   private:
    NavigationState initial_;
    Position goal_;
    GridConfig config_;
};

}  // namespace sentinel::domain

namespace std {
template <>
struct hash<sentinel::domain::TargetSet> {
    size_t operator()(const sentinel::domain::TargetSet &targets) const {
        hash<sentinel::domain::Position> pos_hasher;
        size_t out = targets.size();
        for (const auto &pos : targets) {
            out ^= pos_hasher(pos) + 0x9e3779b9 + (out << 6) + (out >> 2);
        }
        return out;
    }
};

template <>
struct hash<sentinel::domain::NavigationState> {
    size_t operator()(const sentinel::domain::NavigationState &state) const {
        size_t out = hash<sentinel::domain::Position>{}(state.position);
        out ^= hash<int>{}(state.battery) + 0x9e3779b9 + (out << 6) + (out >> 2);
        out ^= hash<sentinel::domain::TargetSet>{}(state.targets) + 0x9e3779b9 + (out << 6) +
               (out >> 2);
        return out;
    }
};
}  // namespace std
