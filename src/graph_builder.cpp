#include "bitgraph/core/graph_builder.hpp"

#include <string>

#include "bitgraph/core/error.hpp"

namespace bitgraph::core {

GraphBuilder::GraphBuilder(std::int32_t expected_size) {
  if (expected_size < 0) {
    throw InvalidArgument("GraphBuilder: expected_size must be >= 0");
  }
  size_ = expected_size;
}

void GraphBuilder::ensure(NodeId node) {
  if (node < 0) {
    throw IndexOutOfRange("GraphBuilder: node id must be >= 0, got " + std::to_string(node));
  }
  if (node >= size_) size_ = node + 1;
}

GraphBuilder& GraphBuilder::add_edge(NodeId from, NodeId to) {
  ensure(from);
  ensure(to);
  edges_.emplace_back(from, to);
  return *this;
}

GraphBuilder& GraphBuilder::add_edges(std::span<const Edge> edges) {
  for (const auto& [from, to] : edges) add_edge(from, to);
  return *this;
}

GraphBuilder& GraphBuilder::add_orphan(NodeId node) {
  ensure(node);
  return *this;
}

Graph GraphBuilder::build() const {
  const auto n = static_cast<std::size_t>(size_);
  std::vector<Bits> outbound(n, Bits(n));
  for (const auto& [from, to] : edges_) {
    outbound[static_cast<std::size_t>(from)].set(static_cast<std::size_t>(to));
  }
  return Graph::from_edges(std::move(outbound));
}

} // namespace bitgraph::core
