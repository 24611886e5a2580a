#include "domain/grid_world_to_proto.hh"

namespace sentinel::domain::proto {
void pack_into(const domain::Position &in, Cell *out) {
    out->set_x(in.x);
    out->set_y(in.y);
}

domain::Position unpack_from(const Cell &in) { return {.x = in.x(), .y = in.y()}; }

void pack_into(const domain::WindDirection &in, WindDirection *out) {
    switch (in) {
        case domain::WindDirection::NONE:
            *out = WIND_NONE;
            break;
        case domain::WindDirection::EAST:
            *out = WIND_EAST;
            break;
        case domain::WindDirection::WEST:
            *out = WIND_WEST;
            break;
    }
}

domain::WindDirection unpack_from(const WindDirection &in) {
    switch (in) {
        case WIND_EAST:
            return domain::WindDirection::EAST;
        case WIND_WEST:
            return domain::WindDirection::WEST;
        default:
            return domain::WindDirection::NONE;
    }
}

void pack_into(const domain::GridConfig &in, GridConfig *out) {
    out->set_width(in.width);
    out->set_height(in.height);

    out->mutable_obstacles()->Clear();
    for (const auto &obstacle : in.obstacles) {
        pack_into(obstacle, out->mutable_obstacles()->Add());
    }

    out->mutable_urban_zones()->Clear();
    for (const auto &urban_zone : in.urban_zones) {
        pack_into(urban_zone, out->mutable_urban_zones()->Add());
    }

    pack_into(in.base, out->mutable_base());
    WindDirection wind_direction;
    pack_into(in.wind_direction, &wind_direction);
    out->set_wind_direction(wind_direction);
    out->set_wind_factor(in.wind_factor);
}

domain::GridConfig unpack_from(const GridConfig &in) {
    domain::GridConfig out{
        .width = in.width(),
        .height = in.height(),
        .obstacles = {},
        .urban_zones = {},
        .base = unpack_from(in.base()),
        .wind_direction = unpack_from(in.wind_direction()),
        // An unset factor leaves distance estimates unscaled
        .wind_factor = in.wind_factor() == 0.0 ? 1.0 : in.wind_factor(),
    };

    for (const auto &proto_cell : in.obstacles()) {
        out.obstacles.insert(unpack_from(proto_cell));
    }
    for (const auto &proto_cell : in.urban_zones()) {
        out.urban_zones.insert(unpack_from(proto_cell));
    }
    return out;
}
}  // namespace sentinel::domain::proto
