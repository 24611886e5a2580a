#pragma once

#include <vector>

#include "domain/grid_world.hh"
#include "mission/ticket.hh"

namespace sentinel::mission {

constexpr int DEFAULT_MAX_STEPS = 200;

struct MissionConfig {
    domain::GridConfig grid;
    int battery_capacity;
    // Ceiling on the number of simulation steps the driver runs
    int max_steps;
    std::vector<Ticket> fallback_tickets;
};

// Three sampling tickets spread over the estuary.
std::vector<Ticket> default_fallback_tickets();

// A 10x10 estuary with a base in the top left corner, mangrove and bridge obstacles, urban
// neighbourhoods along the banks and a prevailing wind from the east.
MissionConfig default_mission_config();

}  // namespace sentinel::mission
