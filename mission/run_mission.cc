#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/check.hh"
#include "common/proto/load_from_file.hh"
#include "cxxopts.hpp"
#include "mission/environment_executor.hh"
#include "mission/mission_agent.hh"
#include "mission/mission_config.hh"
#include "mission/mission_config.pb.h"
#include "mission/mission_config_to_proto.hh"
#include "mission/sensors.hh"
#include "mission/ticket_board_service.hh"
#include "mission/ticket_gateway.hh"

namespace sentinel::mission {
namespace {
constexpr double WATER_TEMPERATURE_C = 18.0;

Eigen::Vector2d to_vector(const domain::Position &pos) {
    return Eigen::Vector2d(static_cast<double>(pos.x), static_cast<double>(pos.y));
}

TicketGateway make_gateway(const MissionConfig &config, const bool is_live,
                           const std::filesystem::path &board_path) {
    if (!is_live) {
        std::cout << "Running in simulation mode with " << config.fallback_tickets.size()
                  << " fallback tickets" << std::endl;
        return TicketGateway(config.fallback_tickets);
    }
    std::cout << "Running in live mode against ticket board " << board_path << std::endl;
    return TicketGateway(config.fallback_tickets,
                         std::make_unique<ProtoFileTicketService>(board_path), false);
}

void print_report(const MissionReport &report, const EnvironmentExecutor &env,
                  const EnvironmentExecutor::AgentId agent_id,
                  const SimulatedTelemetry &telemetry) {
    std::cout << "===== Mission report =====" << std::endl;
    std::cout << "Steps: " << env.step_count() << std::endl;
    std::cout << "Tickets processed: " << report.tickets_processed << std::endl;
    std::cout << "Tickets pending: " << report.tickets_pending << std::endl;
    std::cout << "Battery remaining: " << report.battery_remaining << " ("
              << telemetry.battery_level_pct() << "%)" << std::endl;
    std::cout << "Final position: " << report.final_position << std::endl;
    std::cout << "At base: " << (report.at_base ? "yes" : "no") << std::endl;
    std::cout << "Mission complete: " << (report.mission_complete ? "yes" : "no") << std::endl;

    const std::vector<Sample> collected = env.collected_samples(agent_id);
    std::cout << "Collected samples: " << collected.size() << std::endl;
    for (const Sample &sample : collected) {
        SimulatedChemical chemical;
        SimulatedVision vision(WATER_TEMPERATURE_C);
        if (domain::is_urban(env.config(), sample.position)) {
            chemical.set_contamination({{"lead", 0.02}, {"dissolved_oxygen", 4.8}});
            // Runoff from paved ground
            vision.set_temperature(WATER_TEMPERATURE_C + 2.5);
        }
        // Sorted for stable output
        const auto unsorted_reading = chemical.contamination_reading();
        const std::map<std::string, double> reading(unsorted_reading.begin(),
                                                     unsorted_reading.end());
        std::cout << "  #" << sample.ticket_id << " " << sample.title << " at "
                  << sample.position << ":";
        for (const auto &[name, value] : reading) {
            std::cout << " " << name << "=" << value;
        }
        std::cout << " temperature=" << vision.thermal_reading() << "C" << std::endl;
    }
}

int run_mission(const MissionConfig &config, const bool is_live,
                const std::filesystem::path &board_path) {
    TicketGateway gateway = make_gateway(config, is_live, board_path);
    EnvironmentExecutor env(config.grid, config.battery_capacity);
    for (const Ticket &ticket : gateway.list_open_tickets()) {
        const domain::Position position = TicketGateway::coordinates(ticket);
        if (!domain::in_bounds(config.grid, position)) {
            std::cerr << "Ticket #" << ticket.id << " at " << position
                      << " is outside the grid, no sample placed" << std::endl;
            continue;
        }
        env.add_sample(ticket.id, ticket.title, position);
    }

    auto agent = std::make_shared<MissionAgent>(config.grid, config.battery_capacity, gateway);
    const EnvironmentExecutor::AgentId agent_id = env.add_agent(agent);
    SimulatedTelemetry telemetry(to_vector(env.location(agent_id)), 100.0);

    std::cout << env.render() << std::endl;

    while (!env.is_done() && env.step_count() < config.max_steps) {
        const int battery_before = env.battery(agent_id);
        env.step();

        telemetry.set_position(to_vector(env.location(agent_id)));
        telemetry.consume_battery(100.0 * (battery_before - env.battery(agent_id)) /
                                  config.battery_capacity);

        if (agent->mission_complete() || agent->is_stuck()) {
            break;
        }
    }

    if (env.step_count() >= config.max_steps) {
        std::cout << "Step limit of " << config.max_steps << " reached" << std::endl;
    }
    if (agent->is_stuck()) {
        std::cout << "Agent is stuck" << std::endl;
    }
    if (!agent->mission_complete()) {
        // Let the agent see where it ended up so that a finished mission is recognized
        agent->decide(env.percept(agent_id));
    }

    print_report(agent->mission_report(), env, agent_id, telemetry);
    std::cout << env.render() << std::endl;
    return 0;
}

}  // namespace
}  // namespace sentinel::mission

int main(int argc, const char **argv) {
    // clang-format off
    cxxopts::Options options("run_mission", "Run a sampling mission over the estuary grid");
    options.add_options()
        ("config", "Path to a MissionConfig proto. The built in estuary is used if absent",
            cxxopts::value<std::string>())
        ("live", "Use the ticket board as the ticket service instead of the fallback tickets")
        ("ticket_board", "Path to the TicketBoard proto used in live mode",
            cxxopts::value<std::string>()->default_value("ticket_board.pbtxt"))
        ("max_steps", "Overrides the step ceiling of the mission config", cxxopts::value<int>())
        ("help", "Print usage");
    // clang-format on

    auto args = options.parse(argc, argv);
    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    sentinel::mission::MissionConfig config = sentinel::mission::default_mission_config();
    if (args.count("config")) {
        const auto maybe_config =
            sentinel::proto::load_from_file<sentinel::mission::proto::MissionConfig>(
                args["config"].as<std::string>());
        SENTINEL_CHECK(maybe_config.has_value(), "Unable to load mission config",
                       args["config"].as<std::string>());
        config = sentinel::mission::proto::unpack_from(maybe_config.value());
    }
    if (args.count("max_steps")) {
        config.max_steps = args["max_steps"].as<int>();
    }

    return sentinel::mission::run_mission(config, args.count("live") > 0,
                                          args["ticket_board"].as<std::string>());
}
