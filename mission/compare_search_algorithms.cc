#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/check.hh"
#include "common/proto/load_from_file.hh"
#include "cxxopts.hpp"
#include "domain/navigation_problem.hh"
#include "mission/mission_config.hh"
#include "mission/mission_config.pb.h"
#include "mission/mission_config_to_proto.hh"
#include "planning/best_first_search.hh"
#include "planning/breadth_first_search.hh"
#include "planning/instrumented_problem.hh"

namespace sentinel::mission {
namespace {
using Problem = planning::InstrumentedProblem<domain::NavigationProblem>;
using SearchResult = planning::SearchResult<Problem>;

struct Algorithm {
    std::string name;
    std::function<std::optional<SearchResult>(Problem &)> search;
};

struct Measurement {
    std::string name;
    bool is_solved;
    int nodes_expanded;
    double time_ms;
    double path_cost;
    int battery_used;
    int num_actions;
};

// Poses the whole mission as one problem: start at base with a full battery, pass over every
// ticket and come back.
domain::NavigationProblem make_mission_problem(const MissionConfig &config) {
    std::vector<domain::Position> targets;
    for (const Ticket &ticket : config.fallback_tickets) {
        targets.push_back(ticket.coordinates);
    }
    return domain::NavigationProblem(
        domain::NavigationState{
            .position = config.grid.base,
            .battery = config.battery_capacity,
            .targets = domain::TargetSet(std::move(targets)),
        },
        config.grid.base, config.grid);
}

Measurement measure(const Algorithm &algorithm, const MissionConfig &config) {
    domain::NavigationProblem problem = make_mission_problem(config);
    Problem instrumented(problem);

    const auto start = std::chrono::steady_clock::now();
    const std::optional<SearchResult> maybe_result = algorithm.search(instrumented);
    const auto end = std::chrono::steady_clock::now();

    Measurement out{
        .name = algorithm.name,
        .is_solved = maybe_result.has_value(),
        .nodes_expanded = instrumented.num_expanded(),
        .time_ms = std::chrono::duration<double, std::milli>(end - start).count(),
        .path_cost = 0.0,
        .battery_used = 0,
        .num_actions = 0,
    };
    if (maybe_result.has_value()) {
        out.path_cost = maybe_result->cost;
        out.battery_used = config.battery_capacity - maybe_result->states.back().battery;
        out.num_actions = static_cast<int>(maybe_result->actions.size());
    }
    return out;
}

void print_table(const std::vector<Measurement> &measurements) {
    std::cout << std::left << std::setw(24) << "Algorithm" << std::right << std::setw(10)
              << "Solved" << std::setw(12) << "Expanded" << std::setw(12) << "Time (ms)"
              << std::setw(10) << "Cost" << std::setw(10) << "Battery" << std::setw(10)
              << "Actions" << std::endl;
    for (const Measurement &m : measurements) {
        std::cout << std::left << std::setw(24) << m.name << std::right << std::setw(10)
                  << (m.is_solved ? "yes" : "no") << std::setw(12) << m.nodes_expanded
                  << std::setw(12) << std::fixed << std::setprecision(3) << m.time_ms
                  << std::setw(10) << std::setprecision(1) << m.path_cost << std::setw(10)
                  << m.battery_used << std::setw(10) << m.num_actions << std::endl;
    }
}

void compare_search_algorithms(const MissionConfig &config) {
    const std::vector<Algorithm> algorithms = {
        {.name = "Breadth first",
         .search = [](Problem &problem) { return planning::breadth_first_search(problem); }},
        {.name = "Greedy best first",
         .search = [](Problem &problem) { return planning::greedy_best_first_search(problem); }},
        {.name = "A*", .search = [](Problem &problem) { return planning::a_star_search(problem); }},
    };

    std::cout << "Visiting " << config.fallback_tickets.size() << " targets from base "
              << config.grid.base << " with battery " << config.battery_capacity << std::endl;
    std::vector<Measurement> measurements;
    for (const Algorithm &algorithm : algorithms) {
        measurements.push_back(measure(algorithm, config));
    }
    print_table(measurements);
}

}  // namespace
}  // namespace sentinel::mission

int main(int argc, const char **argv) {
    // clang-format off
    cxxopts::Options options("compare_search_algorithms",
                             "Compare search procedures on a whole sampling mission");
    options.add_options()
        ("config", "Path to a MissionConfig proto. The built in estuary is used if absent",
            cxxopts::value<std::string>())
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

    sentinel::mission::compare_search_algorithms(config);
}
