#include <gtest/gtest.h>
#include <vector>
#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph_builder.hpp"

using namespace bitgraph::core;

TEST(GraphBuilder, SizeFollowsHighestNode) {
  GraphBuilder b;
  b.add_edge(0, 7);
  EXPECT_EQ(b.size(), 8);
  EXPECT_EQ(b.build().num_nodes(), 8);
}

TEST(GraphBuilder, ExpectedSizeIsAMinimum) {
  auto g = GraphBuilder(10).add_edge(1, 2).build();
  EXPECT_EQ(g.num_nodes(), 10);
  EXPECT_EQ(g.orphans().count(), 8u);
}

TEST(GraphBuilder, OrphansExtendTheGraph) {
  auto g = GraphBuilder().add_edge(0, 1).add_orphan(4).build();
  EXPECT_EQ(g.num_nodes(), 5);
  EXPECT_TRUE(g.orphans().test(4));
}

TEST(GraphBuilder, DuplicateEdgesCollapse) {
  std::vector<Edge> edges = {{0, 1}, {0, 1}, {1, 0}};
  auto g = GraphBuilder().add_edges(edges).build();
  EXPECT_EQ(g.total_cardinality(), 2u);
}

TEST(GraphBuilder, SelfEdge) {
  auto g = GraphBuilder().add_edge(0, 0).build();
  EXPECT_TRUE(g.contains_edge(0, 0));
  EXPECT_TRUE(g.is_recursive(0));
}

TEST(GraphBuilder, BuildDoesNotReset) {
  GraphBuilder b;
  b.add_edge(0, 1);
  auto first = b.build();
  b.add_edge(1, 2);
  auto second = b.build();
  EXPECT_EQ(first.num_nodes(), 2);
  EXPECT_EQ(second.num_nodes(), 3);
  EXPECT_EQ(second.total_cardinality(), 2u);
}

TEST(GraphBuilder, NegativeIdsRejected) {
  GraphBuilder b;
  EXPECT_THROW(b.add_edge(-1, 0), IndexOutOfRange);
  EXPECT_THROW(b.add_orphan(-3), IndexOutOfRange);
  EXPECT_THROW(GraphBuilder(-1), InvalidArgument);
}

TEST(GraphBuilder, EmptyBuilderBuildsEmptyGraph) {
  auto g = GraphBuilder().build();
  EXPECT_EQ(g.num_nodes(), 0);
}
