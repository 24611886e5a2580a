#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mission/ticket.hh"
#include "mission/ticket_service.hh"

namespace sentinel::mission {

// The agent's only view of the ticket service.
//
// In simulation mode every call is served from an in-memory copy of the fallback tickets. In live
// mode calls go to the remote service until it raises TicketServiceUnavailable; from then on the
// gateway serves the fallback tickets for the rest of its lifetime. A failed update is applied to
// the fallback tickets so that the mission's view stays consistent.
class TicketGateway {
   public:
    // Simulation mode.
    explicit TicketGateway(std::vector<Ticket> fallback_tickets);

    // Live mode when use_simulation is false. remote must not be null in that case.
    TicketGateway(std::vector<Ticket> fallback_tickets, std::unique_ptr<TicketService> remote,
                  const bool use_simulation);

    std::vector<Ticket> list_tickets();
    std::vector<Ticket> list_open_tickets();

    // Returns false if no ticket has the given id.
    bool update_status(const int ticket_id, const TicketStatus status,
                       const std::optional<CollectionReport> &payload = std::nullopt);

    static domain::Position coordinates(const Ticket &ticket) { return ticket.coordinates; }

    bool using_fallback() const { return use_simulation_; }

   private:
    void switch_to_fallback(const std::string &reason);

    InMemoryTicketService fallback_;
    std::unique_ptr<TicketService> remote_;
    bool use_simulation_;
};

}  // namespace sentinel::mission
