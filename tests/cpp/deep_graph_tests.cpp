#include <gtest/gtest.h>
#include <vector>
#include "bitgraph/core/graph.hpp"
#include "test_utils.hpp"

using namespace bitgraph::core;
using namespace bitgraph::core::test;

// Long chains must not exhaust the call stack: every traversal keeps its own
// explicit stack or queue.

TEST(DeepGraphs, WalkLongChain) {
  const int n = 10000;
  auto g = make_line_graph(n);
  RecordingVisitor v;
  g.walk(v);
  ASSERT_EQ(v.entered.size(), static_cast<std::size_t>(n));
  EXPECT_EQ(v.entered.back().second, n - 1);
}

TEST(DeepGraphs, ClosureAndSearchOnLongCycle) {
  const int n = 10000;
  auto g = make_circle_graph(n);
  EXPECT_EQ(g.closure_size(0), static_cast<std::size_t>(n));
  EXPECT_TRUE(g.is_recursive(n / 2));
  std::size_t delivered = 0;
  g.depth_first_search(0, Direction::Down, [&](NodeId) { ++delivered; });
  EXPECT_EQ(delivered, static_cast<std::size_t>(n));
}

TEST(DeepGraphs, PathThroughLongChain) {
  const int n = 3000;
  auto g = make_line_graph(n);
  auto paths = g.paths_between(0, n - 1);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths.front().size(), static_cast<std::size_t>(n));
  EXPECT_EQ(g.distance(n - 1, 0), n);
}

TEST(DeepGraphs, TopologicalSortLongChain) {
  const int n = 10000;
  auto g = make_line_graph(n);
  Bits all(static_cast<std::size_t>(n));
  all.set();
  auto order = g.topological_sort(all);
  ASSERT_EQ(order.size(), static_cast<std::size_t>(n));
  EXPECT_EQ(order.start(), 0);
  EXPECT_EQ(order.end(), n - 1);
}
