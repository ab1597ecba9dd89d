/*
  closure: transitive reachability and the structural queries built on it.

  reach() is a worklist expansion over either edge array; closure_of(n) seeds
  it with n's direct successors, so n itself only shows up when a cycle leads
  back to it.
*/
#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"

namespace bitgraph::core {

Bits Graph::reach(const std::vector<Bits>& edges, Bits frontier) {
  std::vector<std::size_t> work;
  for (auto b = frontier.find_first(); b != Bits::npos; b = frontier.find_next(b)) work.push_back(b);
  while (!work.empty()) {
    auto u = work.back();
    work.pop_back();
    const Bits& out = edges[u];
    for (auto v = out.find_first(); v != Bits::npos; v = out.find_next(v)) {
      if (frontier.test(v)) continue;
      frontier.set(v);
      work.push_back(v);
    }
  }
  return frontier;
}

Bits Graph::closure_of(NodeId node) const {
  check_node(node, "closure_of");
  return reach(outbound_, outbound_[static_cast<std::size_t>(node)]);
}

Bits Graph::reverse_closure_of(NodeId node) const {
  check_node(node, "reverse_closure_of");
  return reach(inbound_, inbound_[static_cast<std::size_t>(node)]);
}

std::size_t Graph::closure_size(NodeId node) const {
  return closure_of(node).count();
}

std::size_t Graph::reverse_closure_size(NodeId node) const {
  return reverse_closure_of(node).count();
}

Bits Graph::closure_union(NodeId a, NodeId b) const {
  return closure_of(a) | closure_of(b);
}

Bits Graph::closure_union(std::span<const NodeId> nodes) const {
  Bits result(outbound_.size());
  for (auto n : nodes) result |= closure_of(n);
  return result;
}

Bits Graph::closure_union(const Bits& nodes) const {
  Bits result(outbound_.size());
  for_each_set_bit(nodes, [&](NodeId n) { result |= closure_of(n); });
  return result;
}

Bits Graph::closure_disjunction(NodeId a, NodeId b) const {
  return closure_of(a) ^ closure_of(b);
}

Bits Graph::closure_disjunction(std::span<const NodeId> nodes) const {
  Bits result(outbound_.size());
  for (auto n : nodes) result ^= closure_of(n);
  return result;
}

Bits Graph::closure_disjunction(const Bits& nodes) const {
  Bits result(outbound_.size());
  for_each_set_bit(nodes, [&](NodeId n) { result ^= closure_of(n); });
  return result;
}

bool Graph::is_reachable_from(NodeId a, NodeId b) const {
  check_node(b, "is_reachable_from");
  return closure_of(a).test(static_cast<std::size_t>(b));
}

bool Graph::is_reverse_reachable_from(NodeId a, NodeId b) const {
  check_node(a, "is_reverse_reachable_from");
  return closure_of(b).test(static_cast<std::size_t>(a));
}

bool Graph::is_recursive(NodeId node) const {
  return closure_of(node).test(static_cast<std::size_t>(node));
}

bool Graph::is_indirectly_recursive(NodeId node) const {
  check_node(node, "is_indirectly_recursive");
  const auto n = static_cast<std::size_t>(node);
  Bits successors = outbound_[n];
  successors.reset(n);
  return reach(outbound_, std::move(successors)).test(n);
}

Bits Graph::disjoint_nodes() const {
  const auto n = outbound_.size();
  std::vector<Bits> closures;
  closures.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    closures.push_back(closure_of(static_cast<NodeId>(i)));
    closures.back().reset(i);
  }
  Bits result(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (closures[i].none()) continue;
    Bits own = closures[i];
    for (std::size_t j = 0; j < n && own.any(); ++j) {
      if (j != i) own -= closures[j];
    }
    if (own.any()) result.set(i);
  }
  return result;
}

namespace {

template <typename SizeOf>
std::vector<NodeId> sorted_by(std::int32_t n, SizeOf&& size_of) {
  std::vector<std::size_t> sizes(static_cast<std::size_t>(n));
  for (NodeId i = 0; i < n; ++i) sizes[static_cast<std::size_t>(i)] = size_of(i);
  std::vector<NodeId> order(static_cast<std::size_t>(n));
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](NodeId a, NodeId b) {
    return sizes[static_cast<std::size_t>(a)] < sizes[static_cast<std::size_t>(b)];
  });
  return order;
}

} // namespace

std::vector<NodeId> Graph::by_closure_size() const {
  return sorted_by(num_nodes(), [&](NodeId i) { return closure_size(i); });
}

std::vector<NodeId> Graph::by_reverse_closure_size() const {
  return sorted_by(num_nodes(), [&](NodeId i) { return reverse_closure_size(i); });
}

Path Graph::topological_sort(const Bits& subset) const {
  const auto n = outbound_.size();
  if (subset.size() != n) {
    throw InvalidArgument("topological_sort: subset has " + std::to_string(subset.size())
                          + " bits but the graph has " + std::to_string(n) + " nodes");
  }
  // Reverse post-order of a DFS over outbound edges puts every node ahead of
  // its descendants; seeding in ascending order keeps the result stable.
  struct Frame { std::size_t node; std::size_t next; };
  Bits seen(n);
  std::vector<std::size_t> finished;
  std::vector<Frame> stack;
  for (auto seed = subset.find_first(); seed != Bits::npos; seed = subset.find_next(seed)) {
    if (seen.test(seed)) continue;
    seen.set(seed);
    stack.push_back({seed, outbound_[seed].find_first()});
    while (!stack.empty()) {
      auto& top = stack.back();
      if (top.next == Bits::npos) {
        finished.push_back(top.node);
        stack.pop_back();
        continue;
      }
      auto bit = top.next;
      top.next = outbound_[top.node].find_next(bit);
      if (seen.test(bit)) continue;
      seen.set(bit);
      stack.push_back({bit, outbound_[bit].find_first()});
    }
  }
  Path result;
  for (auto it = finished.rbegin(); it != finished.rend(); ++it) {
    if (subset.test(*it)) result.add(static_cast<NodeId>(*it));
  }
  return result;
}

} // namespace bitgraph::core
