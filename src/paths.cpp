/*
  paths: simple path enumeration between two nodes.

  A PairSet of already-followed (from, to) edges is shared across the whole
  search, so each directed edge is considered once per call. The search is a
  depth-first extension of the current path (kept as an explicit stack) that
  refuses to re-enter a node already on the path; reaching dst records a copy
  of the path. Results are sorted by the Path order (shortest first).
*/
#include <algorithm>
#include <optional>
#include <vector>

#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/pair_set.hpp"

namespace bitgraph::core {

namespace {

struct PathFrame {
  NodeId node;
  Bits adjacent;
  std::size_t next;
};

} // namespace

std::vector<Path> Graph::enumerate_paths(
    NodeId src, NodeId dst, const std::function<Bits(NodeId)>& adjacency) const {
  check_node(src, "paths_between");
  check_node(dst, "paths_between");
  std::vector<Path> paths;
  PairSet seen_pairs(num_nodes());

  Bits first = adjacency(src);
  // The loop below records a path when it follows an edge into dst, except
  // for an edge it has already marked; the direct edge is emitted up front.
  if (first.test(static_cast<std::size_t>(dst))) {
    seen_pairs.add(src, dst);
    paths.push_back(Path{src, dst});
  }

  Path current{src};
  std::vector<PathFrame> stack;
  auto start = first.find_first();
  stack.push_back({src, std::move(first), start});
  while (!stack.empty()) {
    auto& top = stack.back();
    if (top.next == Bits::npos) {
      stack.pop_back();
      current = current.parent_path();
      continue;
    }
    auto bit = static_cast<NodeId>(top.next);
    top.next = top.adjacent.find_next(top.next);
    if (seen_pairs.contains(top.node, bit)) continue;
    seen_pairs.add(top.node, bit);
    if (bit == dst) {
      paths.push_back(current.copy().add(dst));
    } else if (!current.contains(bit)) {
      current.add(bit);
      Bits next = adjacency(bit);
      auto pos = next.find_first();
      stack.push_back({bit, std::move(next), pos});
    }
  }
  std::stable_sort(paths.begin(), paths.end());
  return paths;
}

std::vector<Path> Graph::paths_between(NodeId src, NodeId dst) const {
  return enumerate_paths(src, dst, [this](NodeId n) { return outbound_[static_cast<std::size_t>(n)]; });
}

std::vector<Path> Graph::undirected_paths_between(NodeId src, NodeId dst) const {
  return enumerate_paths(src, dst, [this](NodeId n) { return neighbors(n); });
}

std::optional<Path> Graph::shortest_path_between(NodeId src, NodeId dst) const {
  auto paths = paths_between(src, dst);
  if (paths.empty()) paths = paths_between(dst, src);
  if (paths.empty()) return std::nullopt;
  return paths.front();
}

std::optional<Path> Graph::shortest_undirected_path_between(NodeId src, NodeId dst) const {
  auto paths = undirected_paths_between(src, dst);
  if (paths.empty()) return std::nullopt;
  return paths.front();
}

int Graph::distance(NodeId a, NodeId b) const {
  auto path = shortest_path_between(a, b);
  return path ? static_cast<int>(path->size()) : -1;
}

} // namespace bitgraph::core
