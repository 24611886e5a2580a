#include "mission/mission_agent.hh"

#include <algorithm>
#include <iostream>
#include <utility>

#include "common/check.hh"
#include "planning/best_first_search.hh"

namespace sentinel::mission {
using domain::Action;
using domain::NavigationProblem;
using domain::NavigationState;
using domain::Position;
using domain::TargetSet;

double expected_utility(const int battery, const int distance, const double reward,
                        const double penalty, const double risk_factor) {
    if (distance == 0) {
        return 100.0;
    }
    const double success_prob = std::min(1.0, battery / std::max(1.0, 1.5 * distance));
    return success_prob * reward * risk_factor - (1.0 - success_prob) * penalty;
}

MissionAgent::SearchFunc MissionAgent::default_search() {
    return [](NavigationProblem &problem) { return planning::a_star_search(problem); };
}

MissionAgent::MissionAgent(domain::GridConfig config, const int battery_capacity,
                           TicketGateway &gateway, SearchFunc search)
    : config_(std::move(config)),
      battery_capacity_(battery_capacity),
      gateway_(&gateway),
      search_(std::move(search)),
      phase_(MissionPhase::SYNCING),
      position_(config_.base),
      battery_(battery_capacity),
      returning_to_base_(false),
      mission_complete_(false),
      is_stuck_(false),
      arrived_on_target_(false) {
    domain::validate(config_);
    SENTINEL_CHECK(battery_capacity_ > 0, "Battery capacity must be positive", battery_capacity_);
    SENTINEL_CHECK(static_cast<bool>(search_), "A search procedure is required");
}

Action MissionAgent::decide(const Percept &percept) {
    if (phase_ == MissionPhase::SYNCING) {
        sync_targets();
    }
    update_state(percept);

    if (arrived_on_target_) {
        arrived_on_target_ = false;
        // A target passed over on the way to another one is still sampled
        if (plan_.empty() || plan_.front() != Action::COLLECT) {
            plan_.push_front(Action::COLLECT);
        }
    }

    if (plan_.empty() && !mission_complete_) {
        if (!returning_to_base_) {
            phase_ = MissionPhase::SELECTING_GOAL;
        }
        const std::optional<Position> maybe_goal = formulate_goal();
        if (maybe_goal.has_value()) {
            NavigationProblem problem = formulate_problem(maybe_goal.value());
            const std::vector<Action> plan = search(problem);
            plan_.assign(plan.begin(), plan.end());
            if (plan_.empty() && returning_to_base_ && position_ == config_.base) {
                // Nothing to plan when the return leg starts at the base
                formulate_goal();
                is_stuck_ = false;
            } else {
                is_stuck_ = plan_.empty();
            }
        }
    }

    if (plan_.empty()) {
        return Action::NO_OP;
    }
    const Action action = plan_.front();
    plan_.pop_front();
    return action;
}

void MissionAgent::sync_targets() {
    pending_tickets_.clear();
    pending_targets_.clear();
    for (const Ticket &ticket : gateway_->list_open_tickets()) {
        const Position target = TicketGateway::coordinates(ticket);
        if (!domain::in_bounds(config_, target)) {
            std::cout << "[Agent] Skipping ticket #" << ticket.id << " at " << target
                      << ", outside the grid" << std::endl;
            continue;
        }
        pending_tickets_.push_back(ticket);
        pending_targets_.insert(target);
    }
    std::cout << "[Agent] Synced " << pending_tickets_.size() << " open tickets" << std::endl;
    for (const Ticket &ticket : pending_tickets_) {
        std::cout << "  #" << ticket.id << " " << ticket.title << " at "
                  << TicketGateway::coordinates(ticket) << std::endl;
    }
    phase_ = MissionPhase::SELECTING_GOAL;
}

void MissionAgent::update_state(const Percept &percept) {
    position_ = percept.location;
    battery_ = percept.battery;

    if (!pending_targets_.contains(position_)) {
        return;
    }
    pending_targets_.erase(position_);
    arrived_on_target_ = true;

    const CollectionReport report{
        .battery_remaining = battery_,
        .collection_position = position_,
    };
    const auto reached_begin =
        std::stable_partition(pending_tickets_.begin(), pending_tickets_.end(),
                              [this](const Ticket &ticket) {
                                  return !(TicketGateway::coordinates(ticket) == position_);
                              });
    for (auto iter = reached_begin; iter != pending_tickets_.end(); ++iter) {
        std::cout << "[Agent] Reached ticket #" << iter->id << " at " << position_
                  << " with battery " << battery_ << std::endl;
        gateway_->update_status(iter->id, TicketStatus::CLOSED, report);
        iter->status = TicketStatus::CLOSED;
        iter->payload = report;
        processed_tickets_.push_back(*iter);
    }
    pending_tickets_.erase(reached_begin, pending_tickets_.end());
}

std::optional<Position> MissionAgent::formulate_goal() {
    if (mission_complete_) {
        return std::nullopt;
    }

    if (pending_targets_.empty()) {
        if (position_ == config_.base) {
            std::cout << "[Agent] Back at base " << position_ << ". Mission complete." << std::endl;
            mission_complete_ = true;
            phase_ = MissionPhase::COMPLETE;
            return std::nullopt;
        }
        if (!returning_to_base_) {
            start_return("All targets visited");
        }
        return config_.base;
    }

    // Ties go to the first target in the set's order
    std::optional<Position> nearest;
    for (const Position &target : pending_targets_) {
        if (!nearest.has_value() || domain::manhattan_distance(position_, target) <
                                        domain::manhattan_distance(position_, nearest.value())) {
            nearest = target;
        }
    }
    const Position goal = nearest.value();

    if (battery_ < LOW_BATTERY_FRACTION * battery_capacity_) {
        const int target_distance = domain::manhattan_distance(position_, goal) +
                                    domain::manhattan_distance(goal, config_.base);
        const int base_distance = domain::manhattan_distance(position_, config_.base);
        const double target_utility =
            expected_utility(battery_, target_distance, TARGET_REWARD, TARGET_PENALTY,
                             domain::is_urban(config_, goal) ? URBAN_RISK_FACTOR : 1.0);
        const double base_utility =
            expected_utility(battery_, base_distance, BASE_REWARD, BASE_PENALTY);
        std::cout << "[Agent] Low battery (" << battery_ << "/" << battery_capacity_
                  << "): U(target " << goal << ") = " << target_utility
                  << ", U(base) = " << base_utility << std::endl;
        if (base_utility > target_utility) {
            start_return("Retreat has the higher expected utility");
            return config_.base;
        }
    }

    for (Ticket &ticket : pending_tickets_) {
        if (TicketGateway::coordinates(ticket) == goal &&
            ticket.status != TicketStatus::IN_PROGRESS) {
            gateway_->update_status(ticket.id, TicketStatus::IN_PROGRESS);
            ticket.status = TicketStatus::IN_PROGRESS;
        }
    }
    std::cout << "[Agent] Next target " << goal << std::endl;
    phase_ = MissionPhase::PLANNING;
    return goal;
}

NavigationProblem MissionAgent::formulate_problem(const Position &goal) const {
    if (returning_to_base_) {
        return NavigationProblem(
            NavigationState{.position = position_, .battery = battery_, .targets = TargetSet{}},
            config_.base, config_);
    }
    return NavigationProblem(
        NavigationState{.position = position_, .battery = battery_, .targets = TargetSet{goal}},
        goal, config_);
}

std::vector<Action> MissionAgent::search(NavigationProblem &problem) {
    const std::optional<SearchResult> maybe_result = search_(problem);
    if (maybe_result.has_value()) {
        std::vector<Action> plan = maybe_result->actions;
        if (!returning_to_base_) {
            plan.push_back(Action::COLLECT);
            phase_ = MissionPhase::AWAITING_EXECUTION;
        }
        std::cout << "[Agent] Planned " << plan.size() << " actions to " << problem.goal()
                  << " costing " << maybe_result->cost << std::endl;
        return plan;
    }

    std::cout << "[Agent] No path to " << problem.goal() << std::endl;
    if (returning_to_base_) {
        std::cout << "[Agent] Stuck at " << position_ << " with battery " << battery_
                  << std::endl;
        return {};
    }

    start_return("Target unreachable");
    NavigationProblem retreat = formulate_problem(config_.base);
    const std::optional<SearchResult> maybe_retreat = search_(retreat);
    if (!maybe_retreat.has_value()) {
        std::cout << "[Agent] Stuck at " << position_ << " with battery " << battery_
                  << std::endl;
        return {};
    }
    std::cout << "[Agent] Planned " << maybe_retreat->actions.size()
              << " actions back to base costing " << maybe_retreat->cost << std::endl;
    return maybe_retreat->actions;
}

MissionReport MissionAgent::mission_report() const {
    return MissionReport{
        .tickets_processed = static_cast<int>(processed_tickets_.size()),
        .tickets_pending = static_cast<int>(pending_tickets_.size()),
        .battery_remaining = battery_,
        .final_position = position_,
        .at_base = position_ == config_.base,
        .mission_complete = mission_complete_,
    };
}

void MissionAgent::start_return(const std::string &reason) {
    std::cout << "[Agent] " << reason << ". Returning to base " << config_.base;
    if (!pending_targets_.empty()) {
        std::cout << ", abandoning " << pending_targets_.size() << " targets";
    }
    std::cout << std::endl;
    returning_to_base_ = true;
    pending_targets_.clear();
    phase_ = MissionPhase::RETURNING;
}

}  // namespace sentinel::mission
