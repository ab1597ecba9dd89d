/*
  Graph: construction, invariants and direct edge queries.

  Construction normalizes every edge set to exactly N bits, derives the
  inbound mirror when only outbound sets are given, and caches the top-level
  (roots) and bottom-level (leaves) node sets. The O(edges) mirror check runs
  in debug builds only.
*/
#include "bitgraph/core/graph.hpp"

#include <limits>
#include <sstream>
#include <string>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/debug_log.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/options.hpp"
#include "bitgraph/core/scoring.hpp"

namespace bitgraph::core {

namespace {

void normalize_sizes(std::vector<Bits>& sets, const char* which) {
  const auto n = sets.size();
  for (std::size_t i = 0; i < n; ++i) {
    auto& set = sets[i];
    if (set.size() > n) {
      auto beyond = (n == 0) ? set.find_first() : set.find_next(n - 1);
      if (beyond != Bits::npos) {
        throw IndexOutOfRange(std::string(which) + "[" + std::to_string(i) + "] names node "
                              + std::to_string(beyond) + " but the graph has "
                              + std::to_string(n) + " nodes");
      }
    }
    set.resize(n);
  }
}

#ifndef NDEBUG
void check_mirror(const std::vector<Bits>& outbound, const std::vector<Bits>& inbound) {
  auto fail = [](const char* side, std::size_t a, std::size_t b) {
    throw InvalidArgument(std::string("Graph: ") + side + " edge " + std::to_string(a) + "->"
                          + std::to_string(b) + " has no mirror entry");
  };
  for (std::size_t i = 0; i < outbound.size(); ++i) {
    for (auto j = outbound[i].find_first(); j != Bits::npos; j = outbound[i].find_next(j)) {
      if (!inbound[j].test(i)) fail("outbound", i, j);
    }
    for (auto j = inbound[i].find_first(); j != Bits::npos; j = inbound[i].find_next(j)) {
      if (!outbound[j].test(i)) fail("inbound", j, i);
    }
  }
}
#endif

} // namespace

Graph::Graph(std::vector<Bits> outbound, std::vector<Bits> inbound)
    : outbound_(std::move(outbound)), inbound_(std::move(inbound)) {
  const auto n = outbound_.size();
  Bits has_out(n);
  Bits has_in(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (outbound_[i].any()) has_out.set(i);
    if (inbound_[i].any()) has_in.set(i);
  }
  top_level_ = has_out - has_in;
  bottom_level_ = has_in - has_out;
}

Graph Graph::from_edges(std::vector<Bits> outbound) {
  if (outbound.size() > static_cast<std::size_t>(std::numeric_limits<NodeId>::max())) {
    throw InvalidArgument("Graph::from_edges: too many nodes");
  }
  normalize_sizes(outbound, "outbound");
  const auto n = outbound.size();
  std::vector<Bits> inbound(n, Bits(n));
  for (std::size_t i = 0; i < n; ++i) {
    const auto& set = outbound[i];
    for (auto j = set.find_first(); j != Bits::npos; j = set.find_next(j)) {
      inbound[j].set(i);
    }
  }
  BITGRAPH_DEBUG_LOG("Graph::from_edges: %zu nodes", n);
  return Graph(std::move(outbound), std::move(inbound));
}

Graph Graph::from_edge_pairs(std::vector<Bits> outbound, std::vector<Bits> inbound) {
  if (outbound.size() != inbound.size()) {
    throw InvalidArgument("Graph::from_edge_pairs: outbound and inbound must have the same length ("
                          + std::to_string(outbound.size()) + " vs "
                          + std::to_string(inbound.size()) + ")");
  }
  if (outbound.size() > static_cast<std::size_t>(std::numeric_limits<NodeId>::max())) {
    throw InvalidArgument("Graph::from_edge_pairs: too many nodes");
  }
  normalize_sizes(outbound, "outbound");
  normalize_sizes(inbound, "inbound");
#ifndef NDEBUG
  check_mirror(outbound, inbound);
#endif
  BITGRAPH_DEBUG_LOG("Graph::from_edge_pairs: %zu nodes", outbound.size());
  return Graph(std::move(outbound), std::move(inbound));
}

void Graph::check_node(NodeId node, const char* what) const {
  if (node < 0 || node >= num_nodes()) {
    throw IndexOutOfRange(std::string(what) + ": node " + std::to_string(node)
                          + " out of range of num_nodes " + std::to_string(num_nodes()));
  }
}

std::size_t Graph::total_cardinality() const noexcept {
  std::size_t total = 0;
  for (const auto& set : inbound_) total += set.count();
  return total;
}

bool Graph::contains_edge(NodeId from, NodeId to) const noexcept {
  const auto n = num_nodes();
  if (from < 0 || to < 0 || from >= n || to >= n) return false;
  return outbound_[static_cast<std::size_t>(from)].test(static_cast<std::size_t>(to));
}

bool Graph::has_outbound_edge(NodeId from, NodeId to) const {
  check_node(from, "has_outbound_edge");
  check_node(to, "has_outbound_edge");
  return outbound_[static_cast<std::size_t>(from)].test(static_cast<std::size_t>(to));
}

bool Graph::has_inbound_edge(NodeId from, NodeId to) const {
  check_node(from, "has_inbound_edge");
  check_node(to, "has_inbound_edge");
  return inbound_[static_cast<std::size_t>(from)].test(static_cast<std::size_t>(to));
}

const Bits& Graph::children(NodeId node) const {
  check_node(node, "children");
  return outbound_[static_cast<std::size_t>(node)];
}

const Bits& Graph::parents(NodeId node) const {
  check_node(node, "parents");
  return inbound_[static_cast<std::size_t>(node)];
}

Bits Graph::neighbors(NodeId node) const {
  check_node(node, "neighbors");
  return inbound_[static_cast<std::size_t>(node)] | outbound_[static_cast<std::size_t>(node)];
}

std::size_t Graph::outbound_reference_count(NodeId node) const {
  return children(node).count();
}

std::size_t Graph::inbound_reference_count(NodeId node) const {
  return parents(node).count();
}

bool Graph::is_unreferenced(NodeId node) const {
  return parents(node).none();
}

void Graph::edges(const EdgeConsumer& consumer) const {
  for (NodeId i = 0; i < num_nodes(); ++i) {
    for_each_set_bit(outbound_[static_cast<std::size_t>(i)], [&](NodeId j) { consumer(i, j); });
  }
}

std::vector<Edge> Graph::edge_list() const {
  std::vector<Edge> out;
  out.reserve(total_cardinality());
  edges([&](NodeId a, NodeId b) { out.emplace_back(a, b); });
  return out;
}

PairSet Graph::all_edges() const {
  PairSet set(num_nodes());
  edges([&](NodeId a, NodeId b) { set.add(a, b); });
  return set;
}

Bits Graph::connectors() const {
  const auto n = outbound_.size();
  Bits result(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (inbound_[i].any() && outbound_[i].any()) result.set(i);
  }
  return result;
}

Bits Graph::orphans() const {
  const auto n = outbound_.size();
  Bits result(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (inbound_[i].none() && outbound_[i].none()) result.set(i);
  }
  return result;
}

std::vector<double> Graph::eigenvector_centrality(int max_iterations, double min_difference,
                                                  bool use_in_edges, bool ignore_self_edges,
                                                  bool normalize) const {
  EigenvectorCentralityOptions opts;
  opts.max_iterations = max_iterations;
  opts.min_difference = min_difference;
  opts.use_in_edges = use_in_edges;
  opts.ignore_self_edges = ignore_self_edges;
  opts.normalize = normalize;
  return core::eigenvector_centrality(*this, opts);
}

std::vector<double> Graph::page_rank(double min_difference, double damping_factor,
                                     int max_iterations, bool normalize) const {
  PageRankOptions opts;
  opts.min_difference = min_difference;
  opts.damping_factor = damping_factor;
  opts.max_iterations = max_iterations;
  opts.normalize = normalize;
  return core::page_rank(*this, opts);
}

std::string Graph::to_string() const {
  std::ostringstream os;
  os << "Graph{size=" << num_nodes() << ", totalCardinality=" << total_cardinality() << "}\n";
  struct Dump final : GraphVisitor {
    std::ostringstream& os;
    explicit Dump(std::ostringstream& o) : os(o) {}
    void enter(NodeId node, int depth) override {
      os << std::string(static_cast<std::size_t>(depth) * 2, ' ') << node << '\n';
    }
  } dump(os);
  walk(dump);
  return os.str();
}

} // namespace bitgraph::core
