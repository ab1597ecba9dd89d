#include <gtest/gtest.h>
#include <cstdint>
#include <sstream>
#include <streambuf>
#include <istream>
#include <vector>
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"
#include "test_utils.hpp"

using namespace bitgraph::core;
using namespace bitgraph::core::test;

using Bytes = std::vector<std::uint8_t>;

TEST(Serialization, RoundTripThroughBytes) {
  auto g = make_graph(edges_with_cycles());
  auto restored = Graph::from_bytes(g.to_bytes());
  EXPECT_EQ(restored, g);
  EXPECT_EQ(restored.total_cardinality(), g.total_cardinality());
  EXPECT_EQ(restored.bottom_level_nodes(), g.bottom_level_nodes());
  EXPECT_EQ(restored.parents(30), g.parents(30));
}

TEST(Serialization, RoundTripThroughStream) {
  auto g = make_graph(edges_1());
  std::stringstream ss;
  g.save(ss);
  EXPECT_EQ(Graph::load(ss), g);
}

TEST(Serialization, Layout) {
  auto g = make_graph({{0, 1}});
  Bytes expected = {
    0, 0, 0, 1,                 // version
    0, 0, 0, 2,                 // node count
    0, 0, 0, 1, 0x02,           // node 0 -> {1}
    0xFF, 0xFF, 0xFF, 0xFF      // node 1 has no edges
  };
  EXPECT_EQ(g.to_bytes(), expected);
}

TEST(Serialization, EmptyGraph) {
  Graph g;
  auto bytes = g.to_bytes();
  EXPECT_EQ(bytes, (Bytes{0, 0, 0, 1, 0, 0, 0, 0}));
  EXPECT_EQ(Graph::from_bytes(bytes).num_nodes(), 0);
}

TEST(Serialization, UnknownVersionRejected) {
  Bytes bytes = {0, 0, 0, 2, 0, 0, 0, 0};
  EXPECT_THROW((void)Graph::from_bytes(bytes), UnsupportedFormatVersion);
}

TEST(Serialization, TruncatedInputRejected) {
  auto bytes = make_graph(edges_1()).to_bytes();
  bytes.pop_back();
  EXPECT_THROW((void)Graph::from_bytes(bytes), InvalidArgument);
  EXPECT_THROW((void)Graph::from_bytes(Bytes{0, 0, 0}), InvalidArgument);
}

TEST(Serialization, CorruptEncodingRejected) {
  // Node 0 names node 2 in a two-node graph.
  Bytes beyond = {0, 0, 0, 1, 0, 0, 0, 2, 0, 0, 0, 1, 0x04, 0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW((void)Graph::from_bytes(beyond), InvalidArgument);
  // Encoding longer than (N + 7) / 8 bytes.
  Bytes too_long = {0, 0, 0, 1, 0, 0, 0, 2, 0, 0, 0, 2, 0x02, 0x00, 0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW((void)Graph::from_bytes(too_long), InvalidArgument);
  Bytes negative_count = {0, 0, 0, 1, 0xFF, 0xFF, 0xFF, 0xFE};
  EXPECT_THROW((void)Graph::from_bytes(negative_count), InvalidArgument);
  // A huge node count with no node data behind it.
  Bytes huge_count = {0, 0, 0, 1, 0x7F, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW((void)Graph::from_bytes(huge_count), InvalidArgument);
  Bytes huge_count_one_empty = {0, 0, 0, 1, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_THROW((void)Graph::from_bytes(huge_count_one_empty), InvalidArgument);
}

TEST(Serialization, NonSeekableStreamFailsOnTruncation) {
  // A stream buffer that cannot report its size still fails closed.
  struct ForwardOnly : std::streambuf {
    explicit ForwardOnly(Bytes& data) {
      auto* p = reinterpret_cast<char*>(data.data());
      setg(p, p, p + data.size());
    }
  };
  Bytes data = {0, 0, 0, 1, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  ForwardOnly buf(data);
  std::istream in(&buf);
  EXPECT_THROW((void)Graph::load(in), InvalidArgument);
}
