#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "mission/ticket.hh"
#include "mission/ticket_service.hh"

namespace sentinel::mission {

// A ticket service backed by a TicketBoard proto file that the dispatch side maintains. The board
// is re-read on every call so that tickets added while a mission runs are seen, and every update
// rewrites the board in the text format. A missing or unreadable board raises
// TicketServiceUnavailable.
class ProtoFileTicketService : public TicketService {
   public:
    explicit ProtoFileTicketService(std::filesystem::path board_path);

    std::vector<Ticket> list_tickets() override;
    bool update_ticket(const int id, const TicketStatus status,
                       const std::optional<CollectionReport> &payload) override;

   private:
    std::filesystem::path board_path_;
};

}  // namespace sentinel::mission
