#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <set>

#include "wise_enum.h"

namespace sentinel::domain {

struct Position {
    int x;
    int y;

    bool operator==(const Position &other) const;
    bool operator<(const Position &other) const;
};

std::ostream &operator<<(std::ostream &out, const Position &pos);

// UP decreases y and DOWN increases y, so (0, 0) is the top left corner of a rendered grid.
WISE_ENUM_CLASS(Action, UP, DOWN, LEFT, RIGHT, COLLECT, NO_OP)

// The direction the prevailing wind blows from. Travelling into the wind is slower.
WISE_ENUM_CLASS(WindDirection, NONE, EAST, WEST)

struct GridConfig {
    int width;
    int height;
    std::set<Position> obstacles;
    std::set<Position> urban_zones;
    Position base;
    WindDirection wind_direction;
    // Multiplier applied to horizontal distance estimates against the wind. Must be at least 1.
    double wind_factor;
};

constexpr int NATURAL_STEP_COST = 1;
constexpr int URBAN_STEP_COST = 3;

// Throws check_failure if the bounds are empty, the base is outside the grid or on an obstacle,
// or the wind factor is less than 1.
void validate(const GridConfig &config);

bool in_bounds(const GridConfig &config, const Position &pos);
bool is_obstacle(const GridConfig &config, const Position &pos);
bool is_urban(const GridConfig &config, const Position &pos);

// The battery cost of moving onto destination. Only the destination cell matters.
int step_cost(const GridConfig &config, const Position &destination);

bool is_movement(const Action action);

// The cell reached by applying a movement action to pos. No bounds or obstacle checks are made.
Position displaced(const Position &pos, const Action action);

int manhattan_distance(const Position &a, const Position &b);

// Manhattan distance where the horizontal component is scaled by the wind factor when travelling
// from `from` to `to` moves against the prevailing wind.
double wind_adjusted_distance(const GridConfig &config, const Position &from, const Position &to);

}  // namespace sentinel::domain

namespace std {
template <>
struct hash<sentinel::domain::Position> {
    size_t operator()(const sentinel::domain::Position &pos) const {
        hash<int> int_hasher;
        return int_hasher(pos.x) ^ (int_hasher(pos.y) << 16);
    }
};
}  // namespace std
