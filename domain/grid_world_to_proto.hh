#pragma once

#include "domain/grid_world.hh"
#include "domain/grid_world.pb.h"

namespace sentinel::domain::proto {
void pack_into(const domain::Position &in, Cell *out);
domain::Position unpack_from(const Cell &in);

void pack_into(const domain::WindDirection &in, WindDirection *out);
domain::WindDirection unpack_from(const WindDirection &in);

void pack_into(const domain::GridConfig &in, GridConfig *out);
domain::GridConfig unpack_from(const GridConfig &in);
}  // namespace sentinel::domain::proto
