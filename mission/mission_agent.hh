#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/grid_world.hh"
#include "domain/navigation_problem.hh"
#include "mission/agent_program.hh"
#include "mission/ticket.hh"
#include "mission/ticket_gateway.hh"
#include "planning/search_problem.hh"
#include "wise_enum.h"

namespace sentinel::mission {

WISE_ENUM_CLASS(MissionPhase, SYNCING, SELECTING_GOAL, PLANNING, AWAITING_EXECUTION, RETURNING,
                COMPLETE)

// Below this fraction of the battery capacity the agent weighs retreating to base against
// pressing on to the next target.
constexpr double LOW_BATTERY_FRACTION = 0.3;

constexpr double TARGET_REWARD = 100.0;
constexpr double TARGET_PENALTY = 150.0;
constexpr double BASE_REWARD = 50.0;
constexpr double BASE_PENALTY = 100.0;
// Applied to the target reward when the target lies in an urban zone
constexpr double URBAN_RISK_FACTOR = 0.85;

// Expected utility of committing to a trip of `distance` cells with `battery` units left:
//     P = min(1, battery / max(1, 1.5 * distance))
//     U = P * reward * risk_factor - (1 - P) * penalty
// A trip of zero cells can't fail and is worth 100.
double expected_utility(const int battery, const int distance, const double reward,
                        const double penalty, const double risk_factor = 1.0);

struct MissionReport {
    int tickets_processed;
    int tickets_pending;
    int battery_remaining;
    domain::Position final_position;
    bool at_base;
    bool mission_complete;
};

// Visits the cell of every open ticket, one leg per ticket, then returns to base.
//
// Each call to decide() is one decision cycle: the percept is merged into the agent's memory and,
// once the current plan has been executed, a new goal is chosen, posed as a NavigationProblem and
// handed to the search procedure. The resulting actions are then returned one per cycle.
class MissionAgent : public AgentProgram {
   public:
    using SearchResult = planning::SearchResult<domain::NavigationProblem>;
    using SearchFunc = std::function<std::optional<SearchResult>(domain::NavigationProblem &)>;

    // A* search over the leg
    static SearchFunc default_search();

    // gateway must outlive the agent.
    MissionAgent(domain::GridConfig config, const int battery_capacity, TicketGateway &gateway,
                 SearchFunc search = default_search());

    domain::Action decide(const Percept &percept) override;

    // Loads the open tickets as pending targets. Tickets outside the grid are skipped. decide()
    // calls this on the first cycle if it hasn't been called yet.
    void sync_targets();

    // Records the agent's position and battery. Arriving on a pending target closes its ticket.
    void update_state(const Percept &percept);

    // The next cell to head for, or nullopt if there's nothing left to do. May switch the agent
    // into returning to base, either because no targets remain or because the battery is low and
    // retreating has the higher expected utility.
    std::optional<domain::Position> formulate_goal();

    // Poses the leg from the current position to goal. A return leg carries no targets and ends
    // at the mission base, any other leg ends on the goal itself.
    domain::NavigationProblem formulate_problem(const domain::Position &goal) const;

    // Plans the leg. A collection leg ends with COLLECT. If no plan exists the agent gives up on
    // its targets and plans a single return to base. An empty plan means the agent is stuck.
    std::vector<domain::Action> search(domain::NavigationProblem &problem);

    MissionReport mission_report() const;

    MissionPhase phase() const { return phase_; }
    bool is_stuck() const { return is_stuck_; }
    bool mission_complete() const { return mission_complete_; }
    bool returning_to_base() const { return returning_to_base_; }
    const std::set<domain::Position> &pending_targets() const { return pending_targets_; }
    const std::vector<Ticket> &pending_tickets() const { return pending_tickets_; }
    const std::vector<Ticket> &processed_tickets() const { return processed_tickets_; }
    const domain::Position &position() const { return position_; }
    int battery() const { return battery_; }

   private:
    void start_return(const std::string &reason);

    domain::GridConfig config_;
    int battery_capacity_;
    TicketGateway *gateway_;
    SearchFunc search_;

    MissionPhase phase_;
    domain::Position position_;
    int battery_;
    std::set<domain::Position> pending_targets_;
    std::vector<Ticket> pending_tickets_;
    std::vector<Ticket> processed_tickets_;
    std::deque<domain::Action> plan_;
    bool returning_to_base_;
    bool mission_complete_;
    bool is_stuck_;
    // Set by update_state() when the agent lands on a pending target
    bool arrived_on_target_;
};

}  // namespace sentinel::mission
