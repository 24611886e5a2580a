#pragma once

#include <optional>
#include <string>

#include "domain/grid_world.hh"
#include "wise_enum.h"

namespace sentinel::mission {

WISE_ENUM_CLASS(TicketStatus, OPEN, IN_PROGRESS, CLOSED)

// Attached to a ticket when the sample it asks for has been collected
struct CollectionReport {
    int battery_remaining;
    domain::Position collection_position;

    bool operator==(const CollectionReport &other) const;
};

// A monitoring task issued by the ticket service. Each ticket asks for one sample at coordinates.
struct Ticket {
    int id;
    std::string title;
    std::string description;
    TicketStatus status;
    domain::Position coordinates;
    std::optional<CollectionReport> payload;
};

}  // namespace sentinel::mission
