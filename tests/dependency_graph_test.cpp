#include "flowcore/graph/dependency_graph.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace flowcore;

namespace {

// True when every edge points forward in `order`.
auto respects_order(const DependencyGraph &g,
                    const std::vector<NodeIndex> &order) -> bool {
  std::vector<std::size_t> pos(g.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    pos[order[i]] = i;
  }
  for (NodeIndex n = 0; n < g.size(); ++n) {
    for (const auto &adj : g.dependents(n)) {
      if (pos[n] >= pos[adj.node]) {
        return false;
      }
    }
  }
  return order.size() == g.size();
}

} // namespace

class DependencyGraphTest : public ::testing::Test {
protected:
  auto node(std::string_view key) -> NodeIndex {
    auto idx = graph_.add_node(key);
    EXPECT_TRUE(idx.has_value());
    return *idx;
  }

  DependencyGraph graph_;
};

TEST_F(DependencyGraphTest, EmptyGraph) {
  EXPECT_TRUE(graph_.empty());
  EXPECT_EQ(graph_.size(), 0);
  EXPECT_EQ(graph_.edge_count(), 0);
  EXPECT_TRUE(graph_.topological_order().empty());
}

TEST_F(DependencyGraphTest, AddDuplicateNodeReturnsSameIndex) {
  auto a = node("a");
  auto again = graph_.add_node("a");
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, a);
  EXPECT_EQ(graph_.size(), 1);
  EXPECT_EQ(graph_.key_of(a), "a");
  EXPECT_EQ(graph_.index_of("a"), a);
  EXPECT_EQ(graph_.index_of("missing"), kInvalidNode);
}

TEST_F(DependencyGraphTest, EmptyKeyIsRejected) {
  auto res = graph_.add_node("");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(DependencyGraphTest, AddEdgeRecordsBothDirections) {
  auto a = node("a");
  auto b = node("b");
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());

  ASSERT_EQ(graph_.deps(b).size(), 1);
  EXPECT_EQ(graph_.deps(b)[0].node, a);
  ASSERT_EQ(graph_.dependents(a).size(), 1);
  EXPECT_EQ(graph_.dependents(a)[0].node, b);
  EXPECT_TRUE(graph_.has_edge(a, b));
  EXPECT_FALSE(graph_.has_edge(b, a));
  EXPECT_EQ(graph_.edge_count(), 1);
}

TEST_F(DependencyGraphTest, EdgeByKeyToUnknownNodeIsMissingReference) {
  (void)node("a");
  auto res = graph_.add_edge("a", "ghost");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::MissingReference));
}

TEST_F(DependencyGraphTest, SelfAndDuplicateEdgesAreRejected) {
  auto a = node("a");
  auto b = node("b");
  EXPECT_EQ(graph_.add_edge(a, a).error(),
            make_error_code(Error::InvalidArgument));
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());
  EXPECT_EQ(graph_.add_edge(a, b).error(), make_error_code(Error::DuplicateId));
  EXPECT_EQ(graph_.edge_count(), 1);
}

TEST_F(DependencyGraphTest, CycleIsRejectedWithoutMutation) {
  auto a = node("a");
  auto b = node("b");
  auto c = node("c");
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());
  ASSERT_TRUE(graph_.add_edge(b, c).has_value());
  const auto order_before = graph_.topological_order();

  EXPECT_TRUE(graph_.would_create_cycle(c, a));
  auto res = graph_.add_edge(c, a);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::CycleDetected));

  EXPECT_EQ(graph_.edge_count(), 2);
  EXPECT_FALSE(graph_.has_edge(c, a));
  EXPECT_TRUE(graph_.dependents(c).empty());
  EXPECT_EQ(graph_.topological_order(), order_before);
}

TEST_F(DependencyGraphTest, BackwardEdgeReordersTopologicalOrder) {
  // Insertion order d, c, b, a; edges force a before b before c before d.
  auto d = node("d");
  auto c = node("c");
  auto b = node("b");
  auto a = node("a");
  ASSERT_TRUE(graph_.add_edge(c, d).has_value());
  ASSERT_TRUE(graph_.add_edge(b, c).has_value());
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());

  auto order = graph_.topological_order();
  EXPECT_EQ(order, (std::vector<NodeIndex>{a, b, c, d}));
  EXPECT_TRUE(respects_order(graph_, order));
}

TEST_F(DependencyGraphTest, RemoveNodeEdgesDetachesNode) {
  auto a = node("a");
  auto b = node("b");
  auto c = node("c");
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());
  ASSERT_TRUE(graph_.add_edge(b, c).has_value());

  EXPECT_EQ(graph_.remove_node_edges(b), 2);
  EXPECT_EQ(graph_.edge_count(), 0);
  EXPECT_TRUE(graph_.dependents(a).empty());
  EXPECT_TRUE(graph_.deps(c).empty());
  // With b detached, c -> a no longer closes a cycle.
  EXPECT_TRUE(graph_.add_edge(c, a).has_value());
}

TEST_F(DependencyGraphTest, RandomInsertionsStayAcyclic) {
  constexpr int kNodes = 60;
  for (int i = 0; i < kNodes; ++i) {
    (void)node("n" + std::to_string(i));
  }
  std::mt19937 rng(20261017);
  std::uniform_int_distribution<NodeIndex> pick(0, kNodes - 1);

  int rejected = 0;
  for (int i = 0; i < 600; ++i) {
    const auto from = pick(rng);
    const auto to = pick(rng);
    if (from == to || graph_.has_edge(from, to)) {
      continue;
    }
    const auto edges_before = graph_.edge_count();
    const bool cyclic = graph_.would_create_cycle(from, to);
    auto res = graph_.add_edge(from, to);
    EXPECT_EQ(res.has_value(), !cyclic);
    if (!res) {
      ++rejected;
      EXPECT_EQ(graph_.edge_count(), edges_before);
    }
    ASSERT_TRUE(respects_order(graph_, graph_.topological_order()));
  }
  EXPECT_GT(rejected, 0);
}

TEST_F(DependencyGraphTest, ClearResetsEverything) {
  auto a = node("a");
  auto b = node("b");
  ASSERT_TRUE(graph_.add_edge(a, b).has_value());
  graph_.clear();
  EXPECT_TRUE(graph_.empty());
  EXPECT_EQ(graph_.edge_count(), 0);
  EXPECT_FALSE(graph_.has_node("a"));
}
