#include "mission/ticket.hh"

namespace sentinel::mission {
bool CollectionReport::operator==(const CollectionReport &other) const {
    return battery_remaining == other.battery_remaining &&
           collection_position == other.collection_position;
}
}  // namespace sentinel::mission
