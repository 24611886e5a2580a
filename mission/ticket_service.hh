#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mission/ticket.hh"

namespace sentinel::mission {

// Raised by a TicketService when the service can't be reached or its answer can't be read.
class TicketServiceUnavailable : public std::runtime_error {
   public:
    explicit TicketServiceUnavailable(const std::string &what) : std::runtime_error(what) {}
};

// The ticket operations a mission depends on.
class TicketService {
   public:
    virtual ~TicketService() = default;

    virtual std::vector<Ticket> list_tickets() = 0;

    // Sets the status of the ticket with the given id. The payload, if present, replaces the
    // ticket's payload. Returns false if no ticket has that id.
    virtual bool update_ticket(const int id, const TicketStatus status,
                               const std::optional<CollectionReport> &payload) = 0;
};

// Keeps tickets in memory for the lifetime of the object. Never raises TicketServiceUnavailable.
class InMemoryTicketService : public TicketService {
   public:
    explicit InMemoryTicketService(std::vector<Ticket> tickets);

    std::vector<Ticket> list_tickets() override;
    bool update_ticket(const int id, const TicketStatus status,
                       const std::optional<CollectionReport> &payload) override;

   private:
    std::vector<Ticket> tickets_;
};

}  // namespace sentinel::mission
