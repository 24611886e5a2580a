#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/grid_world.hh"
#include "mission/agent_program.hh"

namespace sentinel::mission {

// A sample waiting to be collected at a ticket's coordinates.
struct Sample {
    int ticket_id;
    std::string title;
    domain::Position position;
    bool is_collected;
};

// The authoritative world state. Owns each agent's battery and collected samples and decides
// whether the actions the agents choose can actually be carried out.
class EnvironmentExecutor {
   public:
    using AgentId = int;

    EnvironmentExecutor(domain::GridConfig config, const int battery_capacity);

    // Places an agent with a full battery. The agent starts at the base unless a location is
    // given.
    AgentId add_agent(std::shared_ptr<AgentProgram> program,
                      const std::optional<domain::Position> &location = std::nullopt);

    void add_sample(const int ticket_id, std::string title, const domain::Position &position);

    // Senses the uncollected samples within one cell, diagonals excluded.
    Percept percept(const AgentId agent) const;

    // Applies an action. Moves into walls or obstacles set the bump flag and cost nothing. Moves
    // the battery can't pay for are refused. COLLECT picks up every uncollected sample on the
    // agent's cell at one unit each. Nothing but NO_OP is accepted once the battery is empty.
    void execute_action(const AgentId agent, const domain::Action action);

    // True when no agent is active, every active agent's battery is exhausted, or every sample
    // has been collected and every active agent is back at base.
    bool is_done() const;

    // Every active agent perceives, decides and then acts once.
    void step();

    void deactivate(const AgentId agent);

    int battery(const AgentId agent) const;
    domain::Position location(const AgentId agent) const;
    bool bumped(const AgentId agent) const;
    bool is_active(const AgentId agent) const;
    std::vector<Sample> collected_samples(const AgentId agent) const;
    const std::vector<Sample> &samples() const { return samples_; }
    int step_count() const { return step_count_; }
    int battery_capacity() const { return battery_capacity_; }
    const domain::GridConfig &config() const { return config_; }

    // Text map of the grid, one row per line:
    //     A agent, S uncollected sample, # obstacle, B base, U urban, . open
    std::string render() const;

   private:
    struct AgentRecord {
        std::shared_ptr<AgentProgram> program;
        domain::Position location;
        bool bump;
        bool is_active;
    };

    const AgentRecord &agent_record(const AgentId agent) const;
    AgentRecord &agent_record(const AgentId agent);

    domain::GridConfig config_;
    int battery_capacity_;
    std::vector<AgentRecord> agents_;
    std::vector<Sample> samples_;
    std::unordered_map<AgentId, int> battery_from_agent_;
    // Indices into samples_
    std::unordered_map<AgentId, std::vector<int>> collected_from_agent_;
    int step_count_;
};

}  // namespace sentinel::mission
