#include "mission/environment_executor.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

#include "common/check.hh"

namespace sentinel::mission {
using domain::Action;
using domain::Position;

namespace {
// Squared Euclidean radius within which samples are sensed
constexpr int SENSING_RADIUS_SQ = 1;
// Battery charged per sample picked up
constexpr int COLLECTION_COST = 1;
}  // namespace

EnvironmentExecutor::EnvironmentExecutor(domain::GridConfig config, const int battery_capacity)
    : config_(std::move(config)), battery_capacity_(battery_capacity), step_count_(0) {
    domain::validate(config_);
    SENTINEL_CHECK(battery_capacity_ > 0, "Battery capacity must be positive", battery_capacity_);
}

EnvironmentExecutor::AgentId EnvironmentExecutor::add_agent(
    std::shared_ptr<AgentProgram> program, const std::optional<Position> &location) {
    SENTINEL_CHECK(program != nullptr, "Agent program must not be null");
    const Position start = location.value_or(config_.base);
    SENTINEL_CHECK(domain::in_bounds(config_, start) && !domain::is_obstacle(config_, start),
                   "Agent must start on an open cell", start.x, start.y);

    const AgentId id = static_cast<AgentId>(agents_.size());
    agents_.push_back(AgentRecord{
        .program = std::move(program),
        .location = start,
        .bump = false,
        .is_active = true,
    });
    battery_from_agent_[id] = battery_capacity_;
    collected_from_agent_[id] = {};
    return id;
}

void EnvironmentExecutor::add_sample(const int ticket_id, std::string title,
                                     const Position &position) {
    SENTINEL_CHECK(domain::in_bounds(config_, position), "Sample is outside the grid", ticket_id,
                   position.x, position.y);
    samples_.push_back(Sample{
        .ticket_id = ticket_id,
        .title = std::move(title),
        .position = position,
        .is_collected = false,
    });
}

Percept EnvironmentExecutor::percept(const AgentId agent) const {
    const Position &location = agent_record(agent).location;
    Percept out{
        .location = location,
        .battery = battery(agent),
        .nearby_samples = {},
        .is_urban = domain::is_urban(config_, location),
        .at_base = location == config_.base,
    };
    for (const Sample &sample : samples_) {
        if (sample.is_collected) {
            continue;
        }
        const int dx = sample.position.x - location.x;
        const int dy = sample.position.y - location.y;
        const int dist_sq = dx * dx + dy * dy;
        if (dist_sq <= SENSING_RADIUS_SQ) {
            out.nearby_samples.push_back(NearbySample{
                .ticket_id = sample.ticket_id,
                .title = sample.title,
                .position = sample.position,
                .distance = std::sqrt(static_cast<double>(dist_sq)),
            });
        }
    }
    return out;
}

void EnvironmentExecutor::execute_action(const AgentId agent, const Action action) {
    AgentRecord &record = agent_record(agent);
    record.bump = false;
    if (action == Action::NO_OP) {
        return;
    }

    int &battery = battery_from_agent_.try_emplace(agent, battery_capacity_).first->second;
    if (battery <= 0) {
        std::cout << "[Env] Agent " << agent << " has no battery left, "
                  << wise_enum::to_string(action) << " refused" << std::endl;
        return;
    }

    if (domain::is_movement(action)) {
        const Position destination = domain::displaced(record.location, action);
        if (!domain::in_bounds(config_, destination) ||
            domain::is_obstacle(config_, destination)) {
            std::cout << "[Env] Agent " << agent << " bumped moving "
                      << wise_enum::to_string(action) << " from " << record.location << std::endl;
            record.bump = true;
            return;
        }

        const int cost = domain::step_cost(config_, destination);
        if (cost > battery) {
            std::cout << "[Env] Agent " << agent << " needs " << cost << " to move "
                      << wise_enum::to_string(action) << " but has " << battery << ", refused"
                      << std::endl;
            return;
        }
        battery -= cost;
        std::cout << "[Env] Agent " << agent << " " << record.location << " -> " << destination
                  << (domain::is_urban(config_, destination) ? " (urban)" : "")
                  << ", battery " << battery << std::endl;
        record.location = destination;
        return;
    }

    if (action == Action::COLLECT) {
        std::vector<int> &collected = collected_from_agent_[agent];
        for (int i = 0; i < static_cast<int>(samples_.size()); i++) {
            Sample &sample = samples_.at(i);
            if (sample.is_collected || !(sample.position == record.location)) {
                continue;
            }
            sample.is_collected = true;
            collected.push_back(i);
            battery -= COLLECTION_COST;
            std::cout << "[Env] Agent " << agent << " collected sample for ticket #"
                      << sample.ticket_id << " at " << sample.position << ", battery "
                      << battery << std::endl;
        }
    }
}

bool EnvironmentExecutor::is_done() const {
    const bool any_active = std::any_of(agents_.begin(), agents_.end(),
                                        [](const AgentRecord &record) { return record.is_active; });
    if (!any_active) {
        return true;
    }

    bool all_exhausted = true;
    bool all_at_base = true;
    for (AgentId id = 0; id < static_cast<AgentId>(agents_.size()); id++) {
        const AgentRecord &record = agents_.at(id);
        if (!record.is_active) {
            continue;
        }
        all_exhausted = all_exhausted && battery(id) <= 0;
        all_at_base = all_at_base && record.location == config_.base;
    }
    if (all_exhausted) {
        return true;
    }

    const bool all_collected =
        std::all_of(samples_.begin(), samples_.end(),
                    [](const Sample &sample) { return sample.is_collected; });
    return all_collected && all_at_base;
}

void EnvironmentExecutor::step() {
    step_count_++;
    if (is_done()) {
        return;
    }

    // Every agent decides on the same world before any of them acts
    std::vector<std::pair<AgentId, Action>> chosen;
    for (AgentId id = 0; id < static_cast<AgentId>(agents_.size()); id++) {
        const AgentRecord &record = agents_.at(id);
        if (record.is_active) {
            chosen.emplace_back(id, record.program->decide(percept(id)));
        }
    }
    for (const auto &[id, action] : chosen) {
        execute_action(id, action);
    }
}

void EnvironmentExecutor::deactivate(const AgentId agent) {
    agent_record(agent).is_active = false;
}

int EnvironmentExecutor::battery(const AgentId agent) const {
    agent_record(agent);
    const auto iter = battery_from_agent_.find(agent);
    return iter == battery_from_agent_.end() ? battery_capacity_ : iter->second;
}

Position EnvironmentExecutor::location(const AgentId agent) const {
    return agent_record(agent).location;
}

bool EnvironmentExecutor::bumped(const AgentId agent) const { return agent_record(agent).bump; }

bool EnvironmentExecutor::is_active(const AgentId agent) const {
    return agent_record(agent).is_active;
}

std::vector<Sample> EnvironmentExecutor::collected_samples(const AgentId agent) const {
    agent_record(agent);
    std::vector<Sample> out;
    const auto iter = collected_from_agent_.find(agent);
    if (iter == collected_from_agent_.end()) {
        return out;
    }
    for (const int sample_idx : iter->second) {
        out.push_back(samples_.at(sample_idx));
    }
    return out;
}

std::string EnvironmentExecutor::render() const {
    std::ostringstream out;
    out << "   ";
    for (int x = 0; x < config_.width; x++) {
        out << " " << x % 10;
    }
    out << std::endl;

    for (int y = 0; y < config_.height; y++) {
        out << (y < 10 ? "  " : " ") << y;
        for (int x = 0; x < config_.width; x++) {
            const Position pos{.x = x, .y = y};
            const bool has_agent =
                std::any_of(agents_.begin(), agents_.end(), [&pos](const AgentRecord &record) {
                    return record.is_active && record.location == pos;
                });
            const bool has_sample =
                std::any_of(samples_.begin(), samples_.end(), [&pos](const Sample &sample) {
                    return !sample.is_collected && sample.position == pos;
                });

            char cell = '.';
            if (has_agent) {
                cell = 'A';
            } else if (has_sample) {
                cell = 'S';
            } else if (domain::is_obstacle(config_, pos)) {
                cell = '#';
            } else if (pos == config_.base) {
                cell = 'B';
            } else if (domain::is_urban(config_, pos)) {
                cell = 'U';
            }
            out << " " << cell;
        }
        out << std::endl;
    }
    return out.str();
}

const EnvironmentExecutor::AgentRecord &EnvironmentExecutor::agent_record(
    const AgentId agent) const {
    SENTINEL_CHECK(agent >= 0 && agent < static_cast<AgentId>(agents_.size()), "Unknown agent",
                   agent);
    return agents_.at(agent);
}

EnvironmentExecutor::AgentRecord &EnvironmentExecutor::agent_record(const AgentId agent) {
    SENTINEL_CHECK(agent >= 0 && agent < static_cast<AgentId>(agents_.size()), "Unknown agent",
                   agent);
    return agents_.at(agent);
}

}  // namespace sentinel::mission
