#pragma once

#include <string>
#include <vector>

#include "domain/grid_world.hh"

namespace sentinel::mission {

// An uncollected sample close enough to the agent to be sensed.
struct NearbySample {
    int ticket_id;
    std::string title;
    domain::Position position;
    // Euclidean distance from the agent
    double distance;
};

// What an agent observes at the start of a step.
struct Percept {
    domain::Position location;
    int battery;
    std::vector<NearbySample> nearby_samples;
    bool is_urban;
    bool at_base;
};

// Maps the current percept to the single action the agent takes this step.
class AgentProgram {
   public:
    virtual ~AgentProgram() = default;

    virtual domain::Action decide(const Percept &percept) = 0;
};

}  // namespace sentinel::mission
