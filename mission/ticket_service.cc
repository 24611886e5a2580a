#include "mission/ticket_service.hh"

#include <algorithm>

namespace sentinel::mission {

InMemoryTicketService::InMemoryTicketService(std::vector<Ticket> tickets)
    : tickets_(std::move(tickets)) {}

std::vector<Ticket> InMemoryTicketService::list_tickets() { return tickets_; }

bool InMemoryTicketService::update_ticket(const int id, const TicketStatus status,
                                          const std::optional<CollectionReport> &payload) {
    const auto iter = std::find_if(tickets_.begin(), tickets_.end(),
                                   [id](const Ticket &ticket) { return ticket.id == id; });
    if (iter == tickets_.end()) {
        return false;
    }
    iter->status = status;
    if (payload.has_value()) {
        iter->payload = payload;
    }
    return true;
}

}  // namespace sentinel::mission
