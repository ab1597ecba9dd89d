/*
  derivation: graphs built from other graphs.

  omitting() renumbers through an explicit old->new table (-1 for removed
  nodes) built once from the sorted removal list, then remaps both edge
  arrays through it. diff() compares edge sets through GraphBuilder.
*/
#include <algorithm>
#include <string>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/debug_log.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/graph_builder.hpp"

namespace bitgraph::core {

namespace {

// new_index[old] = old minus the number of removed ids below it, or -1.
std::vector<NodeId> renumbering(std::int32_t n, std::vector<NodeId> removed) {
  std::sort(removed.begin(), removed.end());
  auto dup = std::adjacent_find(removed.begin(), removed.end());
  if (dup != removed.end()) {
    throw InvalidArgument("omitting: node " + std::to_string(*dup) + " listed more than once");
  }
  std::vector<NodeId> new_index(static_cast<std::size_t>(n));
  std::size_t below = 0;
  for (NodeId i = 0; i < n; ++i) {
    if (below < removed.size() && removed[below] == i) {
      new_index[static_cast<std::size_t>(i)] = -1;
      ++below;
    } else {
      new_index[static_cast<std::size_t>(i)] = i - static_cast<NodeId>(below);
    }
  }
  return new_index;
}

std::vector<Bits> remap(const std::vector<Bits>& edges, const std::vector<NodeId>& new_index,
                        std::size_t new_size) {
  std::vector<Bits> out(new_size, Bits(new_size));
  for (std::size_t i = 0; i < edges.size(); ++i) {
    auto from = new_index[i];
    if (from < 0) continue;
    auto& target = out[static_cast<std::size_t>(from)];
    for_each_set_bit(edges[i], [&](NodeId bit) {
      auto to = new_index[static_cast<std::size_t>(bit)];
      if (to >= 0) target.set(static_cast<std::size_t>(to));
    });
  }
  return out;
}

} // namespace

Graph Graph::omitting(std::span<const NodeId> nodes) const {
  for (auto n : nodes) check_node(n, "omitting");
  if (nodes.empty()) return *this;
  auto new_index = renumbering(num_nodes(), std::vector<NodeId>(nodes.begin(), nodes.end()));
  const auto new_size = outbound_.size() - nodes.size();
  BITGRAPH_DEBUG_LOG("Graph::omitting: %zu of %zu nodes removed", nodes.size(), outbound_.size());
  return Graph(remap(outbound_, new_index, new_size), remap(inbound_, new_index, new_size));
}

void Graph::diff(const Graph& other,
                 const std::function<void(const Graph& added, const Graph& removed)>& on_result) const {
  const auto size = std::max(num_nodes(), other.num_nodes());
  GraphBuilder added(size);
  GraphBuilder removed(size);
  edges([&](NodeId a, NodeId b) {
    if (!other.contains_edge(a, b)) removed.add_edge(a, b);
  });
  other.edges([&](NodeId a, NodeId b) {
    if (!contains_edge(a, b)) added.add_edge(a, b);
  });
  on_result(added.build(), removed.build());
}

PairSet Graph::to_pair_set() const {
  PairSet result(num_nodes());
  for (NodeId i = 0; i < num_nodes(); ++i) {
    for_each_set_bit(inbound_[static_cast<std::size_t>(i)], [&](NodeId bit) { result.add(bit, i); });
  }
  return result;
}

} // namespace bitgraph::core
