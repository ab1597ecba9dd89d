/* GraphBuilder: accumulates directed edges and freezes them into a Graph. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/types.hpp"

namespace bitgraph::core {

// The built graph has max(expected_size, highest mentioned id + 1) nodes.
// Adding the same edge twice is harmless. A builder can be reused; build()
// does not reset it.
class GraphBuilder {
public:
  GraphBuilder() = default;
  explicit GraphBuilder(std::int32_t expected_size);

  GraphBuilder& add_edge(NodeId from, NodeId to);
  GraphBuilder& add_edges(std::span<const Edge> edges);
  // Makes sure `node` exists in the built graph without giving it edges.
  GraphBuilder& add_orphan(NodeId node);

  [[nodiscard]] std::int32_t size() const noexcept { return size_; }
  [[nodiscard]] Graph build() const;

private:
  void ensure(NodeId node);

  std::int32_t size_ {0};
  std::vector<Edge> edges_ {};
};

} // namespace bitgraph::core
