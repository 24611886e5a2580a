#pragma once

#include <vector>

#include "mission/ticket.hh"
#include "mission/ticket.pb.h"

namespace sentinel::mission::proto {
void pack_into(const mission::TicketStatus &in, TicketStatus *out);
mission::TicketStatus unpack_from(const TicketStatus &in);

void pack_into(const mission::CollectionReport &in, CollectionReport *out);
mission::CollectionReport unpack_from(const CollectionReport &in);

void pack_into(const mission::Ticket &in, Ticket *out);
mission::Ticket unpack_from(const Ticket &in);

void pack_into(const std::vector<mission::Ticket> &in, TicketBoard *out);
std::vector<mission::Ticket> unpack_from(const TicketBoard &in);
}  // namespace sentinel::mission::proto
