#include "mission/mission_config_to_proto.hh"

#include "domain/grid_world_to_proto.hh"
#include "mission/ticket_to_proto.hh"

namespace sentinel::mission::proto {
using domain::proto::pack_into;
using domain::proto::unpack_from;

void pack_into(const mission::MissionConfig &in, MissionConfig *out) {
    pack_into(in.grid, out->mutable_grid());
    out->set_battery_capacity(in.battery_capacity);
    out->set_max_steps(in.max_steps);

    out->mutable_fallback_tickets()->Clear();
    for (const auto &ticket : in.fallback_tickets) {
        pack_into(ticket, out->mutable_fallback_tickets()->Add());
    }
}

mission::MissionConfig unpack_from(const MissionConfig &in) {
    mission::MissionConfig out{
        .grid = unpack_from(in.grid()),
        .battery_capacity = in.battery_capacity(),
        // An unset step ceiling means the default one
        .max_steps = in.max_steps() > 0 ? in.max_steps() : DEFAULT_MAX_STEPS,
        .fallback_tickets = {},
    };

    out.fallback_tickets.reserve(in.fallback_tickets_size());
    for (const auto &proto_ticket : in.fallback_tickets()) {
        out.fallback_tickets.push_back(unpack_from(proto_ticket));
    }
    return out;
}
}  // namespace sentinel::mission::proto
