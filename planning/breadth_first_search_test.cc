#include "planning/breadth_first_search.hh"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

namespace sentinel::planning {
namespace {
using NodeId = int;

// Moves along the edges of a fixed graph. Entering a node costs 1 unless listed in cost_to_enter.
class GraphProblem {
   public:
    using State = NodeId;
    using Action = NodeId;
    using Goal = NodeId;

    GraphProblem(std::unordered_map<NodeId, std::vector<NodeId>> graph, NodeId initial,
                 NodeId goal, std::unordered_map<NodeId, double> cost_to_enter = {})
        : graph_(std::move(graph)),
          cost_to_enter_(std::move(cost_to_enter)),
          initial_(initial),
          goal_(goal) {}

    std::vector<NodeId> actions(const NodeId &node) const {
        const auto iter = graph_.find(node);
        return iter == graph_.end() ? std::vector<NodeId>{} : iter->second;
    }

    NodeId result(const NodeId &, const NodeId &action) const { return action; }

    bool goal_test(const NodeId &node) const { return node == goal_; }

    double path_cost(const double cost, const NodeId &, const NodeId &, const NodeId &to) const {
        const auto iter = cost_to_enter_.find(to);
        return cost + (iter == cost_to_enter_.end() ? 1.0 : iter->second);
    }

    double h(const NodeId &) const { return 0.0; }

    NodeId &initial() { return initial_; }
    NodeId &goal() { return goal_; }

   private:
    std::unordered_map<NodeId, std::vector<NodeId>> graph_;
    std::unordered_map<NodeId, double> cost_to_enter_;
    NodeId initial_;
    NodeId goal_;
};

// Create the following graph.
//       1
//       ▲
//       ▼
//   3◄─►2◄─►4
const std::unordered_map<NodeId, std::vector<NodeId>> STAR_GRAPH = {
    {{1}, {2}}, {{2}, {3, 4}}, {{3}, {2}}, {{4}, {2}}};

}  // namespace

TEST(BreadthFirstSearchTest, path_to_leaf) {
    // Setup
    GraphProblem problem(STAR_GRAPH, 1, 4);

    // Action
    const auto result = breadth_first_search(problem);

    // Verification
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states, (std::vector<NodeId>{1, 2, 4}));
    EXPECT_EQ(result->actions, (std::vector<NodeId>{2, 4}));
    EXPECT_EQ(result->cost, 2.0);
}

TEST(BreadthFirstSearchTest, initial_state_is_goal) {
    // Setup
    GraphProblem problem(STAR_GRAPH, 3, 3);

    // Action
    const auto result = breadth_first_search(problem);

    // Verification
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states, (std::vector<NodeId>{3}));
    EXPECT_TRUE(result->actions.empty());
    EXPECT_EQ(result->num_nodes_expanded, 0);
}

TEST(BreadthFirstSearchTest, prefers_fewest_actions_over_lowest_cost) {
    // Setup
    //   1 ─► 4 is direct but expensive, 1 ─► 2 ─► 3 ─► 4 is cheap
    GraphProblem problem({{1, {2, 4}}, {2, {3}}, {3, {4}}}, 1, 4, {{4, 100.0}});

    // Action
    const auto result = breadth_first_search(problem);

    // Verification
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states, (std::vector<NodeId>{1, 4}));
    EXPECT_EQ(result->cost, 100.0);
}

TEST(BreadthFirstSearchTest, disconnected_goal_returns_nullopt) {
    // Setup
    GraphProblem problem(STAR_GRAPH, 1, 5);

    // Action
    const auto result = breadth_first_search(problem);

    // Verification
    EXPECT_FALSE(result.has_value());
}

}  // namespace sentinel::planning
