#pragma once

#include "mission/mission_config.hh"
#include "mission/mission_config.pb.h"

namespace sentinel::mission::proto {
void pack_into(const mission::MissionConfig &in, MissionConfig *out);
mission::MissionConfig unpack_from(const MissionConfig &in);
}  // namespace sentinel::mission::proto
