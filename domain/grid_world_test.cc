#include "domain/grid_world.hh"

#include <string>

#include "common/check.hh"
#include "gtest/gtest.h"

namespace sentinel::domain {
namespace {
GridConfig make_config(const WindDirection wind_direction, const double wind_factor) {
    return GridConfig{
        .width = 5,
        .height = 4,
        .obstacles = {{.x = 2, .y = 2}},
        .urban_zones = {{.x = 1, .y = 0}},
        .base = {.x = 0, .y = 0},
        .wind_direction = wind_direction,
        .wind_factor = wind_factor,
    };
}
}  // namespace

TEST(GridWorldTest, bounds_and_cell_kinds) {
    // Setup
    const GridConfig config = make_config(WindDirection::NONE, 1.0);

    // Action + Verification
    EXPECT_TRUE(in_bounds(config, {.x = 0, .y = 0}));
    EXPECT_TRUE(in_bounds(config, {.x = 4, .y = 3}));
    EXPECT_FALSE(in_bounds(config, {.x = 5, .y = 3}));
    EXPECT_FALSE(in_bounds(config, {.x = 4, .y = 4}));
    EXPECT_FALSE(in_bounds(config, {.x = -1, .y = 0}));

    EXPECT_TRUE(is_obstacle(config, {.x = 2, .y = 2}));
    EXPECT_FALSE(is_obstacle(config, {.x = 1, .y = 0}));
    EXPECT_TRUE(is_urban(config, {.x = 1, .y = 0}));
    EXPECT_FALSE(is_urban(config, {.x = 0, .y = 1}));
}

TEST(GridWorldTest, step_cost_depends_on_destination) {
    // Setup
    const GridConfig config = make_config(WindDirection::NONE, 1.0);

    // Action + Verification
    EXPECT_EQ(step_cost(config, {.x = 1, .y = 0}), URBAN_STEP_COST);
    EXPECT_EQ(step_cost(config, {.x = 0, .y = 1}), NATURAL_STEP_COST);
    EXPECT_EQ(URBAN_STEP_COST, 3);
    EXPECT_EQ(NATURAL_STEP_COST, 1);
}

TEST(GridWorldTest, displacement_of_movement_actions) {
    // Setup
    const Position start{.x = 3, .y = 3};

    // Action + Verification
    EXPECT_EQ(displaced(start, Action::UP), (Position{.x = 3, .y = 2}));
    EXPECT_EQ(displaced(start, Action::DOWN), (Position{.x = 3, .y = 4}));
    EXPECT_EQ(displaced(start, Action::LEFT), (Position{.x = 2, .y = 3}));
    EXPECT_EQ(displaced(start, Action::RIGHT), (Position{.x = 4, .y = 3}));
    EXPECT_TRUE(is_movement(Action::RIGHT));
    EXPECT_FALSE(is_movement(Action::COLLECT));
    EXPECT_FALSE(is_movement(Action::NO_OP));
}

TEST(GridWorldTest, displacing_by_non_movement_throws) {
    // Setup
    const Position start{.x = 3, .y = 3};

    // Action + Verification
    EXPECT_THROW(displaced(start, Action::COLLECT), check_failure);
    EXPECT_THROW(displaced(start, Action::NO_OP), check_failure);
}

TEST(GridWorldTest, wind_penalizes_only_travel_against_it) {
    // Setup
    const GridConfig east = make_config(WindDirection::EAST, 1.5);
    const GridConfig west = make_config(WindDirection::WEST, 2.0);
    const GridConfig calm = make_config(WindDirection::NONE, 3.0);
    const Position a{.x = 0, .y = 0};
    const Position b{.x = 4, .y = 2};

    // Action + Verification
    EXPECT_EQ(manhattan_distance(a, b), 6);
    // An easterly wind opposes travel towards increasing x
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(east, a, b), 4 * 1.5 + 2);
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(east, b, a), 6.0);
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(west, a, b), 6.0);
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(west, b, a), 4 * 2.0 + 2);
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(calm, a, b), 6.0);
    EXPECT_DOUBLE_EQ(wind_adjusted_distance(calm, b, a), 6.0);
}

TEST(GridWorldTest, invalid_configs_are_rejected) {
    // Setup
    GridConfig base_on_obstacle = make_config(WindDirection::NONE, 1.0);
    base_on_obstacle.base = {.x = 2, .y = 2};
    GridConfig base_outside = make_config(WindDirection::NONE, 1.0);
    base_outside.base = {.x = 7, .y = 0};
    GridConfig empty = make_config(WindDirection::NONE, 1.0);
    empty.width = 0;
    const GridConfig weak_wind = make_config(WindDirection::EAST, 0.5);

    // Action + Verification
    EXPECT_NO_THROW(validate(make_config(WindDirection::EAST, 1.5)));
    EXPECT_THROW(validate(base_on_obstacle), check_failure);
    EXPECT_THROW(validate(base_outside), check_failure);
    EXPECT_THROW(validate(empty), check_failure);
    EXPECT_THROW(validate(weak_wind), check_failure);
}

TEST(GridWorldTest, actions_have_printable_names) {
    // Action + Verification
    EXPECT_EQ(std::string(wise_enum::to_string(Action::UP)), "UP");
    EXPECT_EQ(std::string(wise_enum::to_string(Action::COLLECT)), "COLLECT");
    EXPECT_EQ(std::string(wise_enum::to_string(WindDirection::EAST)), "EAST");
}
}  // namespace sentinel::domain
