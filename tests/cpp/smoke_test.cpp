#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "bitgraph/core/debug_log.hpp"
#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/graph_builder.hpp"

using namespace bitgraph::core;

TEST(GraphSmoke, ConstructFromBuilder) {
  auto g = GraphBuilder().add_edge(0, 1).add_edge(1, 2).build();
  EXPECT_EQ(g.num_nodes(), 3);
  EXPECT_EQ(g.total_cardinality(), 2u);
  EXPECT_TRUE(g.contains_edge(0, 1));
  EXPECT_FALSE(g.contains_edge(1, 0));
}

TEST(GraphSmoke, ConstructFromEdgeSets) {
  std::vector<Bits> out(3, Bits(3));
  out[0].set(1);
  out[1].set(2);
  auto g = Graph::from_edges(out);
  EXPECT_EQ(g.num_nodes(), 3);
  EXPECT_TRUE(g.has_inbound_edge(2, 1));
  EXPECT_EQ(g.closure_size(0), 2u);
}

TEST(GraphSmoke, EmptyGraph) {
  Graph g;
  EXPECT_EQ(g.num_nodes(), 0);
  EXPECT_EQ(g.total_cardinality(), 0u);
  EXPECT_TRUE(g.edge_list().empty());
}

namespace {
std::string g_last_debug;
void capture_debug(const char* message) { g_last_debug = message; }
} // namespace

TEST(DebugLog, CallbackReceivesFormattedMessage) {
  bitgraph::debug::set_debug_callback(&capture_debug);
  bitgraph::debug::debug_output("closure of %d has %d nodes", 3, 7);
  bitgraph::debug::clear_debug_callback();
  EXPECT_NE(g_last_debug.find("[DEBUG][T"), std::string::npos);
  EXPECT_NE(g_last_debug.find("closure of 3 has 7 nodes"), std::string::npos);
}

TEST(DebugLog, LongMessagesAreNotTruncated) {
  const std::string payload(4000, 'x');
  bitgraph::debug::set_debug_callback(&capture_debug);
  bitgraph::debug::debug_output("%s|end", payload.c_str());
  bitgraph::debug::clear_debug_callback();
  EXPECT_NE(g_last_debug.find(payload + "|end"), std::string::npos);
}
