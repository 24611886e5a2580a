#include "mission/mission_config.hh"

namespace sentinel::mission {

std::vector<Ticket> default_fallback_tickets() {
    return {
        {
            .id = 1,
            .title = "North point sampling - degraded mangrove",
            .description = "Collect water and sediment samples along the northern stretch.",
            .status = TicketStatus::OPEN,
            .coordinates = {.x = 7, .y = 2},
            .payload = std::nullopt,
        },
        {
            .id = 2,
            .title = "Heavy metals check - industrial zone",
            .description = "Measure heavy metal concentrations near the outfalls.",
            .status = TicketStatus::OPEN,
            .coordinates = {.x = 3, .y = 8},
            .payload = std::nullopt,
        },
        {
            .id = 3,
            .title = "Biodiversity survey - crab habitat",
            .description = "Assess the mangrove crab habitat.",
            .status = TicketStatus::OPEN,
            .coordinates = {.x = 8, .y = 6},
            .payload = std::nullopt,
        },
    };
}

MissionConfig default_mission_config() {
    return MissionConfig{
        .grid =
            {
                .width = 10,
                .height = 10,
                // Dense mangrove, a bridge and riverside vegetation
                .obstacles = {{4, 4}, {5, 4}, {6, 3}, {7, 4}, {2, 6}},
                .urban_zones = {{1, 1}, {2, 1}, {3, 1}, {1, 2}, {2, 2}, {5, 5}, {6, 5}, {4, 3},
                                {5, 3}},
                .base = {.x = 0, .y = 0},
                .wind_direction = domain::WindDirection::EAST,
                .wind_factor = 1.5,
            },
        .battery_capacity = 60,
        .max_steps = DEFAULT_MAX_STEPS,
        .fallback_tickets = default_fallback_tickets(),
    };
}

}  // namespace sentinel::mission
