#include "mission/ticket_gateway.hh"

#include <algorithm>
#include <iostream>

#include "common/check.hh"

namespace sentinel::mission {

TicketGateway::TicketGateway(std::vector<Ticket> fallback_tickets)
    : TicketGateway(std::move(fallback_tickets), nullptr, true) {}

TicketGateway::TicketGateway(std::vector<Ticket> fallback_tickets,
                             std::unique_ptr<TicketService> remote, const bool use_simulation)
    : fallback_(std::move(fallback_tickets)),
      remote_(std::move(remote)),
      use_simulation_(use_simulation) {
    SENTINEL_CHECK(use_simulation_ || remote_ != nullptr,
                   "Live mode requires a remote ticket service");
}

std::vector<Ticket> TicketGateway::list_tickets() {
    if (!use_simulation_) {
        try {
            return remote_->list_tickets();
        } catch (const TicketServiceUnavailable &e) {
            switch_to_fallback(e.what());
        }
    }
    return fallback_.list_tickets();
}

std::vector<Ticket> TicketGateway::list_open_tickets() {
    std::vector<Ticket> out = list_tickets();
    out.erase(std::remove_if(out.begin(), out.end(),
                             [](const Ticket &ticket) {
                                 return ticket.status != TicketStatus::OPEN;
                             }),
              out.end());
    return out;
}

bool TicketGateway::update_status(const int ticket_id, const TicketStatus status,
                                  const std::optional<CollectionReport> &payload) {
    if (!use_simulation_) {
        try {
            const bool was_updated = remote_->update_ticket(ticket_id, status, payload);
            if (was_updated) {
                std::cout << "  [API] Ticket #" << ticket_id << " -> "
                          << wise_enum::to_string(status) << std::endl;
            }
            return was_updated;
        } catch (const TicketServiceUnavailable &e) {
            std::cout << "  Failed to update ticket #" << ticket_id << ": " << e.what()
                      << std::endl;
            switch_to_fallback(e.what());
        }
    }

    const bool was_updated = fallback_.update_ticket(ticket_id, status, payload);
    if (was_updated) {
        std::cout << "  [SIM] Ticket #" << ticket_id << " -> " << wise_enum::to_string(status)
                  << std::endl;
    }
    return was_updated;
}

void TicketGateway::switch_to_fallback(const std::string &reason) {
    std::cout << "  Ticket service unavailable (" << reason << "). Using fallback tickets."
              << std::endl;
    use_simulation_ = true;
}

}  // namespace sentinel::mission
