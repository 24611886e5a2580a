#include "mission/ticket_to_proto.hh"

#include "domain/grid_world_to_proto.hh"

namespace sentinel::mission::proto {
using domain::proto::pack_into;
using domain::proto::unpack_from;

void pack_into(const mission::TicketStatus &in, TicketStatus *out) {
    switch (in) {
        case mission::TicketStatus::OPEN:
            *out = TICKET_OPEN;
            break;
        case mission::TicketStatus::IN_PROGRESS:
            *out = TICKET_IN_PROGRESS;
            break;
        case mission::TicketStatus::CLOSED:
            *out = TICKET_CLOSED;
            break;
    }
}

mission::TicketStatus unpack_from(const TicketStatus &in) {
    switch (in) {
        case TICKET_IN_PROGRESS:
            return mission::TicketStatus::IN_PROGRESS;
        case TICKET_CLOSED:
            return mission::TicketStatus::CLOSED;
        default:
            return mission::TicketStatus::OPEN;
    }
}

void pack_into(const mission::CollectionReport &in, CollectionReport *out) {
    out->set_battery_remaining(in.battery_remaining);
    pack_into(in.collection_position, out->mutable_collection_position());
}

mission::CollectionReport unpack_from(const CollectionReport &in) {
    return mission::CollectionReport{
        .battery_remaining = in.battery_remaining(),
        .collection_position = unpack_from(in.collection_position()),
    };
}

void pack_into(const mission::Ticket &in, Ticket *out) {
    out->set_id(in.id);
    out->set_title(in.title);
    out->set_description(in.description);
    TicketStatus status;
    pack_into(in.status, &status);
    out->set_status(status);
    pack_into(in.coordinates, out->mutable_coordinates());
    if (in.payload.has_value()) {
        pack_into(in.payload.value(), out->mutable_payload());
    } else {
        out->clear_payload();
    }
}

mission::Ticket unpack_from(const Ticket &in) {
    return mission::Ticket{
        .id = in.id(),
        .title = in.title(),
        .description = in.description(),
        .status = unpack_from(in.status()),
        .coordinates = unpack_from(in.coordinates()),
        .payload = in.has_payload() ? std::make_optional(unpack_from(in.payload())) : std::nullopt,
    };
}

void pack_into(const std::vector<mission::Ticket> &in, TicketBoard *out) {
    out->mutable_tickets()->Clear();
    for (const auto &ticket : in) {
        pack_into(ticket, out->mutable_tickets()->Add());
    }
}

std::vector<mission::Ticket> unpack_from(const TicketBoard &in) {
    std::vector<mission::Ticket> out;
    out.reserve(in.tickets_size());
    for (const auto &proto_ticket : in.tickets()) {
        out.push_back(unpack_from(proto_ticket));
    }
    return out;
}
}  // namespace sentinel::mission::proto
