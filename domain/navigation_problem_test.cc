#include "domain/navigation_problem.hh"

#include <algorithm>
#include <functional>
#include <vector>

#include "common/check.hh"
#include "gtest/gtest.h"
#include "planning/best_first_search.hh"
#include "planning/breadth_first_search.hh"

namespace sentinel::domain {
namespace {
GridConfig open_grid(const int width, const int height) {
    return GridConfig{
        .width = width,
        .height = height,
        .obstacles = {},
        .urban_zones = {},
        .base = {.x = 0, .y = 0},
        .wind_direction = WindDirection::NONE,
        .wind_factor = 1.0,
    };
}
}  // namespace

TEST(TargetSetTest, order_independent_equality_and_hash) {
    // Setup
    const TargetSet a{{.x = 2, .y = 0}, {.x = 1, .y = 1}, {.x = 0, .y = 3}};
    const TargetSet b{{.x = 0, .y = 3}, {.x = 2, .y = 0}, {.x = 1, .y = 1}, {.x = 2, .y = 0}};

    // Action + Verification
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 3);
    EXPECT_EQ(std::hash<TargetSet>{}(a), std::hash<TargetSet>{}(b));
    EXPECT_TRUE(a.contains({.x = 1, .y = 1}));
    EXPECT_FALSE(a.without({.x = 1, .y = 1}).contains({.x = 1, .y = 1}));
    EXPECT_EQ(a.without({.x = 4, .y = 4}), a);
}

TEST(NavigationProblemTest, round_trip_to_single_target_costs_four) {
    // Setup
    NavigationProblem problem(
        {.position = {.x = 0, .y = 0}, .battery = 10, .targets = {{.x = 2, .y = 0}}},
        {.x = 0, .y = 0}, open_grid(3, 3));

    // Action
    const auto result = planning::a_star_search(problem);

    // Verification
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 4.0);
    EXPECT_EQ(result->actions.size(), 4);
    EXPECT_EQ(result->states.back().battery, 6);
    EXPECT_EQ(result->states.back().position, (Position{.x = 0, .y = 0}));
    EXPECT_TRUE(result->states.back().targets.empty());
}

TEST(NavigationProblemTest, obstacle_blocks_action) {
    // Setup
    GridConfig config = open_grid(3, 3);
    config.obstacles = {{.x = 1, .y = 0}};
    const NavigationProblem problem(
        {.position = {.x = 0, .y = 0}, .battery = 10, .targets = {}}, {.x = 0, .y = 0}, config);

    // Action
    const std::vector<Action> actions = problem.actions(problem.initial());

    // Verification
    EXPECT_EQ(actions, (std::vector<Action>{Action::DOWN}));
}

TEST(NavigationProblemTest, urban_destination_costs_three) {
    // Setup
    GridConfig config = open_grid(3, 3);
    config.urban_zones = {{.x = 1, .y = 0}};
    const NavigationProblem problem(
        {.position = {.x = 0, .y = 0}, .battery = 10, .targets = {}}, {.x = 0, .y = 0}, config);

    // Action
    const NavigationState into_city = problem.result(problem.initial(), Action::RIGHT);
    const NavigationState out_of_city = problem.result(into_city, Action::DOWN);

    // Verification
    EXPECT_EQ(into_city.position, (Position{.x = 1, .y = 0}));
    EXPECT_EQ(into_city.battery, 7);
    EXPECT_EQ(problem.path_cost(0.0, problem.initial(), Action::RIGHT, into_city), 3.0);
    EXPECT_EQ(out_of_city.battery, 6);
    EXPECT_EQ(problem.path_cost(3.0, into_city, Action::DOWN, out_of_city), 4.0);
}

TEST(NavigationProblemTest, actions_stay_in_bounds_and_off_obstacles) {
    // Setup
    GridConfig config = open_grid(4, 4);
    config.obstacles = {{.x = 1, .y = 1}, {.x = 2, .y = 3}};
    const NavigationProblem problem(
        {.position = {.x = 0, .y = 0}, .battery = 10, .targets = {}}, {.x = 0, .y = 0}, config);

    for (int x = 0; x < config.width; x++) {
        for (int y = 0; y < config.height; y++) {
            const NavigationState state{.position = {.x = x, .y = y}, .battery = 5, .targets = {}};

            // Action
            const std::vector<Action> actions = problem.actions(state);

            // Verification
            for (const Action action : actions) {
                const Position destination = problem.result(state, action).position;
                EXPECT_TRUE(in_bounds(config, destination));
                EXPECT_FALSE(is_obstacle(config, destination));
            }
        }
    }
}

TEST(NavigationProblemTest, actions_keep_fixed_order) {
    // Setup
    const NavigationProblem problem(
        {.position = {.x = 1, .y = 1}, .battery = 10, .targets = {}}, {.x = 0, .y = 0},
        open_grid(3, 3));

    // Action
    const std::vector<Action> actions = problem.actions(problem.initial());

    // Verification
    EXPECT_EQ(actions,
              (std::vector<Action>{Action::UP, Action::DOWN, Action::LEFT, Action::RIGHT}));
}

TEST(NavigationProblemTest, exhausted_battery_has_no_actions) {
    // Setup
    const NavigationProblem problem(
        {.position = {.x = 1, .y = 1}, .battery = 10, .targets = {}}, {.x = 0, .y = 0},
        open_grid(3, 3));

    // Action + Verification
    EXPECT_TRUE(
        problem.actions({.position = {.x = 1, .y = 1}, .battery = 0, .targets = {}}).empty());
    EXPECT_TRUE(
        problem.actions({.position = {.x = 1, .y = 1}, .battery = -2, .targets = {}}).empty());
    EXPECT_FALSE(
        problem.actions({.position = {.x = 1, .y = 1}, .battery = 1, .targets = {}}).empty());
}

TEST(NavigationProblemTest, goal_requires_every_condition) {
    // Setup
    const Position base{.x = 0, .y = 0};
    const NavigationProblem problem({.position = {.x = 2, .y = 2}, .battery = 10, .targets = {}},
                                    base, open_grid(3, 3));

    // Action + Verification
    EXPECT_TRUE(problem.goal_test({.position = base, .battery = 0, .targets = {}}));
    EXPECT_TRUE(problem.goal_test({.position = base, .battery = 4, .targets = {}}));
    // Pending target
    EXPECT_FALSE(
        problem.goal_test({.position = base, .battery = 4, .targets = {{.x = 1, .y = 1}}}));
    // Away from base
    EXPECT_FALSE(problem.goal_test({.position = {.x = 1, .y = 0}, .battery = 4, .targets = {}}));
    // Overdrawn battery
    EXPECT_FALSE(problem.goal_test({.position = base, .battery = -1, .targets = {}}));
}

TEST(NavigationProblemTest, targets_never_grow_along_a_path) {
    // Setup
    const NavigationProblem problem(
        {.position = {.x = 0, .y = 0},
         .battery = 30,
         .targets = {{.x = 1, .y = 0}, {.x = 2, .y = 2}, {.x = 0, .y = 2}}},
        {.x = 0, .y = 0}, open_grid(3, 3));
    const std::vector<Action> path = {Action::RIGHT, Action::LEFT, Action::RIGHT, Action::DOWN,
                                      Action::DOWN,  Action::RIGHT, Action::LEFT, Action::LEFT};

    // Action
    std::vector<NavigationState> states = {problem.initial()};
    for (const Action action : path) {
        states.push_back(problem.result(states.back(), action));
    }

    // Verification
    for (int i = 1; i < static_cast<int>(states.size()); i++) {
        const TargetSet &before = states.at(i - 1).targets;
        const TargetSet &after = states.at(i).targets;
        EXPECT_LE(after.size(), before.size());
        for (const Position &target : after) {
            EXPECT_TRUE(before.contains(target));
        }
    }
    EXPECT_TRUE(states.back().targets.empty());
}

TEST(NavigationProblemTest, heuristic_is_admissible_without_urban_zones_or_wind) {
    // Setup
    GridConfig config = open_grid(5, 5);
    config.obstacles = {{.x = 1, .y = 1}, {.x = 2, .y = 1}, {.x = 3, .y = 3}};

    for (int x = 0; x < config.width; x++) {
        for (int y = 0; y < config.height; y++) {
            if (is_obstacle(config, {.x = x, .y = y})) {
                continue;
            }
            NavigationProblem problem(
                {.position = {.x = x, .y = y}, .battery = 40, .targets = {{.x = 4, .y = 4}}},
                config.base, config);

            // Action
            const auto result = planning::breadth_first_search(problem);

            // Verification
            // With unit steps the fewest-action path is also the cheapest one
            ASSERT_TRUE(result.has_value());
            EXPECT_LE(problem.h(problem.initial()), result->cost);
        }
    }
}

TEST(NavigationProblemTest, heuristic_uses_best_single_target) {
    // Setup
    GridConfig config = open_grid(6, 6);
    config.wind_direction = WindDirection::EAST;
    config.wind_factor = 2.0;
    const NavigationProblem problem(
        {.position = {.x = 0, .y = 0},
         .battery = 40,
         .targets = {{.x = 3, .y = 0}, {.x = 0, .y = 4}}},
        {.x = 0, .y = 0}, config);

    // Action
    const double estimate = problem.h(problem.initial());
    const double home_estimate =
        problem.h({.position = {.x = 2, .y = 0}, .battery = 40, .targets = {}});

    // Verification
    // (3, 0): 3 * 2 against the wind then 3 back = 9. (0, 4): 4 + 4 = 8
    EXPECT_DOUBLE_EQ(estimate, 8.0);
    EXPECT_DOUBLE_EQ(home_estimate, 2.0);
}

TEST(NavigationProblemTest, out_of_grid_start_is_rejected) {
    // Action + Verification
    EXPECT_THROW(NavigationProblem({.position = {.x = 3, .y = 0}, .battery = 5, .targets = {}},
                                   {.x = 0, .y = 0}, open_grid(3, 3)),
                 check_failure);
}
}  // namespace sentinel::domain
