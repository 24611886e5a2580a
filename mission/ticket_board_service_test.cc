#include "mission/ticket_board_service.hh"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "common/proto/load_from_file.hh"
#include "gtest/gtest.h"
#include "mission/mission_config.hh"
#include "mission/ticket.pb.h"
#include "mission/ticket_to_proto.hh"

namespace sentinel::mission {
namespace {
std::filesystem::path get_tmp_dir() {
    const char *maybe_tmp_dir = std::getenv("TEST_TMPDIR");
    if (maybe_tmp_dir) {
        return maybe_tmp_dir;
    }
    return "/tmp";
}

std::filesystem::path write_board(const std::string &name) {
    const std::filesystem::path board_path = get_tmp_dir() / name;
    proto::TicketBoard board;
    proto::pack_into(default_fallback_tickets(), &board);
    EXPECT_TRUE(sentinel::proto::write_text_to_file(board, board_path));
    return board_path;
}
}  // namespace

TEST(ProtoFileTicketServiceTest, lists_tickets_on_board) {
    // Setup
    ProtoFileTicketService service(write_board("list_board.pbtxt"));

    // Action
    const std::vector<Ticket> tickets = service.list_tickets();

    // Verification
    ASSERT_EQ(tickets.size(), 3);
    EXPECT_EQ(tickets.at(0).id, 1);
    EXPECT_EQ(tickets.at(0).title, default_fallback_tickets().at(0).title);
    EXPECT_EQ(tickets.at(1).coordinates, (domain::Position{.x = 3, .y = 8}));
    EXPECT_EQ(tickets.at(2).status, TicketStatus::OPEN);
    EXPECT_FALSE(tickets.at(2).payload.has_value());
}

TEST(ProtoFileTicketServiceTest, update_is_written_to_board) {
    // Setup
    const std::filesystem::path board_path = write_board("update_board.pbtxt");
    ProtoFileTicketService service(board_path);
    const CollectionReport report{.battery_remaining = 17,
                                  .collection_position = {.x = 8, .y = 6}};

    // Action
    const bool was_updated = service.update_ticket(3, TicketStatus::CLOSED, report);

    // Verification
    EXPECT_TRUE(was_updated);
    // A fresh reader of the board sees the change
    const auto maybe_board = sentinel::proto::load_from_file<proto::TicketBoard>(board_path);
    ASSERT_TRUE(maybe_board.has_value());
    const std::vector<Ticket> tickets = proto::unpack_from(maybe_board.value());
    ASSERT_EQ(tickets.size(), 3);
    EXPECT_EQ(tickets.at(2).status, TicketStatus::CLOSED);
    ASSERT_TRUE(tickets.at(2).payload.has_value());
    EXPECT_EQ(tickets.at(2).payload.value(), report);
    EXPECT_EQ(tickets.at(0).status, TicketStatus::OPEN);
}

TEST(ProtoFileTicketServiceTest, unknown_ticket_leaves_board_untouched) {
    // Setup
    ProtoFileTicketService service(write_board("unknown_board.pbtxt"));

    // Action
    const bool was_updated = service.update_ticket(12, TicketStatus::CLOSED, std::nullopt);

    // Verification
    EXPECT_FALSE(was_updated);
    for (const Ticket &ticket : service.list_tickets()) {
        EXPECT_EQ(ticket.status, TicketStatus::OPEN);
    }
}

TEST(ProtoFileTicketServiceTest, missing_board_is_unavailable) {
    // Setup
    const std::filesystem::path board_path = get_tmp_dir() / "no_such_board.pbtxt";
    std::filesystem::remove(board_path);
    ProtoFileTicketService service(board_path);

    // Action + Verification
    EXPECT_THROW(service.list_tickets(), TicketServiceUnavailable);
    EXPECT_THROW(service.update_ticket(1, TicketStatus::CLOSED, std::nullopt),
                 TicketServiceUnavailable);
}

TEST(ProtoFileTicketServiceTest, garbled_board_is_unavailable) {
    // Setup
    const std::filesystem::path board_path = get_tmp_dir() / "garbled_board.pbtxt";
    {
        std::ofstream file_out(board_path);
        file_out << "Hello World!";
    }
    ProtoFileTicketService service(board_path);

    // Action + Verification
    EXPECT_THROW(service.list_tickets(), TicketServiceUnavailable);
}
}  // namespace sentinel::mission
