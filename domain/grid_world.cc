#include "domain/grid_world.hh"

#include <cstdlib>

#include "common/check.hh"

namespace sentinel::domain {

bool Position::operator==(const Position &other) const { return x == other.x && y == other.y; }

bool Position::operator<(const Position &other) const {
    return x < other.x || (x == other.x && y < other.y);
}

std::ostream &operator<<(std::ostream &out, const Position &pos) {
    out << "(" << pos.x << ", " << pos.y << ")";
    return out;
}

void validate(const GridConfig &config) {
    SENTINEL_CHECK(config.width > 0 && config.height > 0, "Grid must not be empty", config.width,
                   config.height);
    SENTINEL_CHECK(in_bounds(config, config.base), "Base must be inside the grid", config.base.x,
                   config.base.y);
    SENTINEL_CHECK(!is_obstacle(config, config.base), "Base can't be an obstacle", config.base.x,
                   config.base.y);
    SENTINEL_CHECK(config.wind_factor >= 1.0, "Wind factor must be at least 1",
                   config.wind_factor);
}

bool in_bounds(const GridConfig &config, const Position &pos) {
    return pos.x >= 0 && pos.x < config.width && pos.y >= 0 && pos.y < config.height;
}

bool is_obstacle(const GridConfig &config, const Position &pos) {
    return config.obstacles.contains(pos);
}

bool is_urban(const GridConfig &config, const Position &pos) {
    return config.urban_zones.contains(pos);
}

int step_cost(const GridConfig &config, const Position &destination) {
    return is_urban(config, destination) ? URBAN_STEP_COST : NATURAL_STEP_COST;
}

bool is_movement(const Action action) {
    return action == Action::UP || action == Action::DOWN || action == Action::LEFT ||
           action == Action::RIGHT;
}

Position displaced(const Position &pos, const Action action) {
    switch (action) {
        case Action::UP:
            return {.x = pos.x, .y = pos.y - 1};
        case Action::DOWN:
            return {.x = pos.x, .y = pos.y + 1};
        case Action::LEFT:
            return {.x = pos.x - 1, .y = pos.y};
        case Action::RIGHT:
            return {.x = pos.x + 1, .y = pos.y};
        default:
            break;
    }
    SENTINEL_CHECK(false, "Not a movement action", wise_enum::to_string(action));
    return pos;
}

int manhattan_distance(const Position &a, const Position &b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

double wind_adjusted_distance(const GridConfig &config, const Position &from,
                              const Position &to) {
    const int dx = std::abs(from.x - to.x);
    const int dy = std::abs(from.y - to.y);

    // A wind from the east opposes travel towards increasing x and vice versa
    const bool is_against_wind =
        (config.wind_direction == WindDirection::EAST && to.x > from.x) ||
        (config.wind_direction == WindDirection::WEST && to.x < from.x);
    const double horizontal = is_against_wind ? dx * config.wind_factor : dx;
    return horizontal + dy;
}

}  // namespace sentinel::domain
