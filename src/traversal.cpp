/*
  traversal: walks and searches over a Graph with explicit stacks/queues.

  Every call owns its scratch Bits, so traversal depth is bounded by heap, not
  by the call stack, and concurrent calls on one Graph share nothing.
    - walk/walk_upwards: pre-order enter, post-order exit, each node once.
    - depth_first_search: post-order delivery of each node's adjacent set.
    - breadth_first_search: a node's frontier is delivered before descending
      into it; nodes are marked when first discovered.
*/
#include <cstddef>
#include <utility>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/graph.hpp"

namespace bitgraph::core {

namespace {

struct WalkFrame {
  NodeId node;
  int depth;
  std::size_t next;  // next candidate bit in the node's edge set
};

std::size_t first_of(const Bits& b) noexcept { return b.find_first(); }

} // namespace

void Graph::walk_from(const std::vector<Bits>& edges, const Bits& seeds, Bits& seen,
                      GraphVisitor& visitor) const {
  std::vector<WalkFrame> stack;
  for (auto seed = seeds.find_first(); seed != Bits::npos; seed = seeds.find_next(seed)) {
    if (seen.test(seed)) continue;
    seen.set(seed);
    visitor.enter(static_cast<NodeId>(seed), 0);
    stack.push_back({static_cast<NodeId>(seed), 0, first_of(edges[seed])});
    while (!stack.empty()) {
      auto& top = stack.back();
      const auto& out = edges[static_cast<std::size_t>(top.node)];
      if (top.next == Bits::npos) {
        visitor.exit(top.node, top.depth);
        stack.pop_back();
        continue;
      }
      auto bit = top.next;
      top.next = out.find_next(bit);
      if (seen.test(bit)) continue;
      seen.set(bit);
      int depth = top.depth + 1;
      visitor.enter(static_cast<NodeId>(bit), depth);
      // top is invalidated by push_back
      stack.push_back({static_cast<NodeId>(bit), depth, first_of(edges[bit])});
    }
  }
}

void Graph::walk(GraphVisitor& visitor) const {
  const auto n = outbound_.size();
  Bits seen(n);
  walk_from(outbound_, top_level_, seen, visitor);
  // Top-level seeding misses components that are entirely cyclic.
  for (std::size_t i = 0; i < n; ++i) {
    if (seen.test(i)) continue;
    Bits seed(n);
    seed.set(i);
    walk_from(outbound_, seed, seen, visitor);
  }
}

void Graph::walk(NodeId start, GraphVisitor& visitor) const {
  check_node(start, "walk");
  Bits seen(outbound_.size());
  Bits seed(outbound_.size());
  seed.set(static_cast<std::size_t>(start));
  walk_from(outbound_, seed, seen, visitor);
}

void Graph::walk_upwards(GraphVisitor& visitor) const {
  const auto n = inbound_.size();
  Bits seen(n);
  walk_from(inbound_, bottom_level_, seen, visitor);
  for (std::size_t i = n; i-- > 0;) {
    if (seen.test(i)) continue;
    Bits seed(n);
    seed.set(i);
    walk_from(inbound_, seed, seen, visitor);
  }
}

void Graph::walk_upwards(NodeId start, GraphVisitor& visitor) const {
  check_node(start, "walk_upwards");
  Bits seen(inbound_.size());
  Bits seed(inbound_.size());
  seed.set(static_cast<std::size_t>(start));
  walk_from(inbound_, seed, seen, visitor);
}

namespace {

struct SearchFrame {
  NodeId node;
  std::size_t next;
};

// Shared shape of the two depth-first searches. `deliver` returns false to
// abort; the return value reports whether an abort happened.
template <typename Deliver>
bool depth_first(const Graph& g, NodeId start, Direction direction, Deliver&& deliver) {
  const auto n = static_cast<std::size_t>(g.num_nodes());
  auto adjacent = [&](NodeId node) -> const Bits& {
    return direction == Direction::Up ? g.parents(node) : g.children(node);
  };
  Bits expanded(n);
  Bits traversed(n);
  std::vector<SearchFrame> stack;
  expanded.set(static_cast<std::size_t>(start));
  stack.push_back({start, adjacent(start).find_first()});
  while (!stack.empty()) {
    auto& top = stack.back();
    const Bits& dests = adjacent(top.node);
    if (top.next != Bits::npos) {
      auto bit = top.next;
      top.next = dests.find_next(bit);
      if (!traversed.test(bit) && !expanded.test(bit)) {
        expanded.set(bit);
        auto node = static_cast<NodeId>(bit);
        stack.push_back({node, adjacent(node).find_first()});
      }
      continue;
    }
    // Everything below this node is done; deliver its adjacent nodes.
    for (auto bit = dests.find_first(); bit != Bits::npos; bit = dests.find_next(bit)) {
      if (traversed.test(bit)) continue;
      traversed.set(bit);
      if (!deliver(static_cast<NodeId>(bit))) return true;
    }
    stack.pop_back();
  }
  return false;
}

struct FrontierFrame {
  std::vector<NodeId> fresh;  // nodes delivered from this frame's node
  std::size_t next;
};

// Delivers a node's undelivered neighbors as one frontier, then descends
// into each frontier member in turn before moving to the next one.
template <typename Deliver>
bool breadth_first(const Graph& g, NodeId start, Direction direction, Deliver&& deliver) {
  const auto n = static_cast<std::size_t>(g.num_nodes());
  Bits traversed(n);
  std::vector<FrontierFrame> stack;
  bool aborted = false;
  auto deliver_frontier = [&](NodeId node) {
    const Bits& dests = direction == Direction::Up ? g.parents(node) : g.children(node);
    FrontierFrame frame{{}, 0};
    for (auto bit = dests.find_first(); bit != Bits::npos; bit = dests.find_next(bit)) {
      if (traversed.test(bit)) continue;
      traversed.set(bit);
      frame.fresh.push_back(static_cast<NodeId>(bit));
      if (!deliver(static_cast<NodeId>(bit))) {
        aborted = true;
        break;
      }
    }
    if (!frame.fresh.empty()) stack.push_back(std::move(frame));
  };
  deliver_frontier(start);
  while (!aborted && !stack.empty()) {
    auto& top = stack.back();
    if (top.next == top.fresh.size()) {
      stack.pop_back();
      continue;
    }
    NodeId node = top.fresh[top.next++];
    // top is invalidated by push_back
    deliver_frontier(node);
  }
  return aborted;
}

} // namespace

void Graph::depth_first_search(NodeId start, Direction direction,
                               const NodeConsumer& consumer) const {
  check_node(start, "depth_first_search");
  (void)depth_first(*this, start, direction, [&](NodeId node) {
    consumer(node);
    return true;
  });
}

void Graph::breadth_first_search(NodeId start, Direction direction,
                                 const NodeConsumer& consumer) const {
  check_node(start, "breadth_first_search");
  (void)breadth_first(*this, start, direction, [&](NodeId node) {
    consumer(node);
    return true;
  });
}

bool Graph::abortable_depth_first_search(NodeId start, Direction direction,
                                         const NodePredicate& predicate) const {
  check_node(start, "abortable_depth_first_search");
  return depth_first(*this, start, direction, predicate);
}

bool Graph::abortable_breadth_first_search(NodeId start, Direction direction,
                                           const NodePredicate& predicate) const {
  check_node(start, "abortable_breadth_first_search");
  return breadth_first(*this, start, direction, predicate);
}

} // namespace bitgraph::core
