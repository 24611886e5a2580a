#include "mission/ticket_board_service.hh"

#include "common/proto/load_from_file.hh"
#include "mission/ticket.pb.h"
#include "mission/ticket_to_proto.hh"

namespace sentinel::mission {
namespace {
proto::TicketBoard read_board(const std::filesystem::path &path) {
    const auto maybe_board = sentinel::proto::load_from_file<proto::TicketBoard>(path);
    if (!maybe_board.has_value()) {
        throw TicketServiceUnavailable("Unable to read ticket board at " + path.string());
    }
    return maybe_board.value();
}
}  // namespace

ProtoFileTicketService::ProtoFileTicketService(std::filesystem::path board_path)
    : board_path_(std::move(board_path)) {}

std::vector<Ticket> ProtoFileTicketService::list_tickets() {
    return proto::unpack_from(read_board(board_path_));
}

bool ProtoFileTicketService::update_ticket(const int id, const TicketStatus status,
                                           const std::optional<CollectionReport> &payload) {
    std::vector<Ticket> tickets = proto::unpack_from(read_board(board_path_));
    InMemoryTicketService board(std::move(tickets));
    if (!board.update_ticket(id, status, payload)) {
        return false;
    }

    proto::TicketBoard board_proto;
    proto::pack_into(board.list_tickets(), &board_proto);
    if (!sentinel::proto::write_text_to_file(board_proto, board_path_)) {
        throw TicketServiceUnavailable("Unable to write ticket board at " + board_path_.string());
    }
    return true;
}

}  // namespace sentinel::mission
