/* Immutable directed graph stored as mirrored outbound/inbound bit vectors. */
#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "bitgraph/core/pair_set.hpp"
#include "bitgraph/core/path.hpp"
#include "bitgraph/core/types.hpp"

namespace bitgraph::core {

// Notes on node identifiers:
// - Nodes are the integers [0, num_nodes()); there are no labels.
// - outbound_[i] and inbound_[i] are both sized num_nodes(); the two arrays
//   are mirror images (outbound_[i][j] == inbound_[j][i]).
// - Nothing mutates a Graph after construction. Derivations (omitting, diff)
//   return new instances, so any number of threads may query one instance.
// - Every method taking a node id throws IndexOutOfRange for ids outside
//   [0, num_nodes()), except contains_edge(), which answers false.
class Graph {
public:
  Graph() = default;

  // Builds inbound sets as the structural inverse of `outbound`. Each set is
  // resized to outbound.size(); a set bit at or beyond that is out of range.
  [[nodiscard]] static Graph from_edges(std::vector<Bits> outbound);

  // Takes both edge arrays as-is. Length mismatch always throws
  // InvalidArgument; mirror consistency is verified in debug builds only.
  [[nodiscard]] static Graph from_edge_pairs(std::vector<Bits> outbound,
                                             std::vector<Bits> inbound);

  // Versioned binary dump of the outbound sets (see serialization.cpp).
  void save(std::ostream& out) const;
  [[nodiscard]] static Graph load(std::istream& in);
  [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;
  [[nodiscard]] static Graph from_bytes(std::span<const std::uint8_t> bytes);

  [[nodiscard]] std::int32_t num_nodes() const noexcept {
    return static_cast<std::int32_t>(outbound_.size());
  }
  // Total number of edges.
  [[nodiscard]] std::size_t total_cardinality() const noexcept;

  // --- Edges -----------------------------------------------------------

  [[nodiscard]] bool contains_edge(NodeId from, NodeId to) const noexcept;
  [[nodiscard]] bool has_outbound_edge(NodeId from, NodeId to) const;
  // True if `from` has an inbound edge from `to` (i.e. edge to -> from).
  [[nodiscard]] bool has_inbound_edge(NodeId from, NodeId to) const;
  [[nodiscard]] const Bits& children(NodeId node) const;
  [[nodiscard]] const Bits& parents(NodeId node) const;
  // Union of parents and children.
  [[nodiscard]] Bits neighbors(NodeId node) const;
  [[nodiscard]] std::size_t outbound_reference_count(NodeId node) const;
  [[nodiscard]] std::size_t inbound_reference_count(NodeId node) const;
  [[nodiscard]] bool is_unreferenced(NodeId node) const;

  // Visits every edge, ascending by source then destination.
  void edges(const EdgeConsumer& consumer) const;
  [[nodiscard]] std::vector<Edge> edge_list() const;
  [[nodiscard]] PairSet all_edges() const;

  // Nodes with outbound but no inbound edges.
  [[nodiscard]] const Bits& top_level_or_orphan_nodes() const noexcept { return top_level_; }
  // Nodes with inbound but no outbound edges.
  [[nodiscard]] const Bits& bottom_level_nodes() const noexcept { return bottom_level_; }
  // Nodes with both inbound and outbound edges.
  [[nodiscard]] Bits connectors() const;
  // Nodes with no edges at all.
  [[nodiscard]] Bits orphans() const;

  // --- Traversal ---------------------------------------------------------

  // Depth-first walk of the whole graph from the top-level nodes; nodes in
  // purely cyclic components are reached by re-seeding from any node not yet
  // visited. Each node is entered exactly once.
  void walk(GraphVisitor& visitor) const;
  void walk(NodeId start, GraphVisitor& visitor) const;
  // Same as walk() over inbound edges, seeded from the bottom-level nodes.
  void walk_upwards(GraphVisitor& visitor) const;
  void walk_upwards(NodeId start, GraphVisitor& visitor) const;

  // Post-order: the nodes adjacent to a node are delivered once everything
  // below them has been explored. Each node is delivered at most once; start
  // is delivered only if a cycle leads back to it.
  void depth_first_search(NodeId start, Direction direction,
                          const NodeConsumer& consumer) const;
  // Delivers the undelivered neighbors of start, then descends into each of
  // them in ascending order, delivering its frontier the same way. Nodes are
  // marked traversed when first discovered, so each is delivered once even if
  // several frontier members reach it.
  void breadth_first_search(NodeId start, Direction direction,
                            const NodeConsumer& consumer) const;
  // As above, but the search stops the first time `predicate` returns false.
  // Returns true if the search was aborted that way.
  [[nodiscard]] bool abortable_depth_first_search(NodeId start, Direction direction,
                                                  const NodePredicate& predicate) const;
  [[nodiscard]] bool abortable_breadth_first_search(NodeId start, Direction direction,
                                                    const NodePredicate& predicate) const;

  // --- Closure -----------------------------------------------------------

  // Nodes reachable via one or more outbound edges. Contains `node` only when
  // `node` is on a cycle.
  [[nodiscard]] Bits closure_of(NodeId node) const;
  // Nodes from which `node` is reachable.
  [[nodiscard]] Bits reverse_closure_of(NodeId node) const;
  [[nodiscard]] std::size_t closure_size(NodeId node) const;
  [[nodiscard]] std::size_t reverse_closure_size(NodeId node) const;

  [[nodiscard]] Bits closure_union(NodeId a, NodeId b) const;
  [[nodiscard]] Bits closure_union(std::span<const NodeId> nodes) const;
  [[nodiscard]] Bits closure_union(const Bits& nodes) const;
  // Nodes in the closure of exactly one of a and b.
  [[nodiscard]] Bits closure_disjunction(NodeId a, NodeId b) const;
  // XOR-reduction of the closures of every listed node.
  [[nodiscard]] Bits closure_disjunction(std::span<const NodeId> nodes) const;
  [[nodiscard]] Bits closure_disjunction(const Bits& nodes) const;

  // True if b is in the closure of a.
  [[nodiscard]] bool is_reachable_from(NodeId a, NodeId b) const;
  // True if a is in the closure of b.
  [[nodiscard]] bool is_reverse_reachable_from(NodeId a, NodeId b) const;
  [[nodiscard]] bool is_recursive(NodeId node) const;
  // Like is_recursive(), but a direct self-edge alone does not count.
  [[nodiscard]] bool is_indirectly_recursive(NodeId node) const;

  // Nodes whose closure holds at least one node outside every other node's
  // closure (self excluded on both sides).
  [[nodiscard]] Bits disjoint_nodes() const;

  // All nodes, stably sorted ascending by closure size.
  [[nodiscard]] std::vector<NodeId> by_closure_size() const;
  [[nodiscard]] std::vector<NodeId> by_reverse_closure_size() const;

  // The nodes of `subset` ordered so that no node is followed by one of its
  // ancestors. Cycles do not stop it; members of a cycle come out in
  // discovery order.
  [[nodiscard]] Path topological_sort(const Bits& subset) const;

  // --- Paths -------------------------------------------------------------

  // Simple paths from src to dst, shortest first. Each directed edge is
  // followed at most once per call, so paths sharing a tail with an earlier
  // path are not repeated.
  [[nodiscard]] std::vector<Path> paths_between(NodeId src, NodeId dst) const;
  // Same over neighbors() (edge direction ignored).
  [[nodiscard]] std::vector<Path> undirected_paths_between(NodeId src, NodeId dst) const;
  // First of paths_between(src, dst), falling back to paths_between(dst, src).
  [[nodiscard]] std::optional<Path> shortest_path_between(NodeId src, NodeId dst) const;
  [[nodiscard]] std::optional<Path> shortest_undirected_path_between(NodeId src, NodeId dst) const;
  // Node count of the shortest path in either direction, or -1.
  [[nodiscard]] int distance(NodeId a, NodeId b) const;

  // --- Derivation --------------------------------------------------------

  // A new graph without `nodes`. Survivors are renumbered by subtracting the
  // number of removed ids below them; edges touching removed nodes are
  // dropped. Duplicate ids throw InvalidArgument.
  [[nodiscard]] Graph omitting(std::span<const NodeId> nodes) const;
  // Calls on_result(added, removed): edges only in `other`, and edges only
  // in this graph. Both results have max(num_nodes(), other.num_nodes()) nodes.
  void diff(const Graph& other,
            const std::function<void(const Graph& added, const Graph& removed)>& on_result) const;
  [[nodiscard]] PairSet to_pair_set() const;

  // --- Scoring façades (see scoring.hpp) ---------------------------------

  [[nodiscard]] std::vector<double> eigenvector_centrality(
      int max_iterations, double min_difference, bool use_in_edges,
      bool ignore_self_edges, bool normalize) const;
  [[nodiscard]] std::vector<double> page_rank(
      double min_difference, double damping_factor, int max_iterations,
      bool normalize) const;

  // Header line plus an indented dump of walk().
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Graph& a, const Graph& b) noexcept {
    return a.outbound_ == b.outbound_;
  }

private:
  Graph(std::vector<Bits> outbound, std::vector<Bits> inbound);

  void check_node(NodeId node, const char* what) const;
  // `frontier` plus every node reachable from it over `edges`.
  [[nodiscard]] static Bits reach(const std::vector<Bits>& edges, Bits frontier);
  void walk_from(const std::vector<Bits>& edges, const Bits& seeds, Bits& seen,
                 GraphVisitor& visitor) const;
  [[nodiscard]] std::vector<Path> enumerate_paths(
      NodeId src, NodeId dst, const std::function<Bits(NodeId)>& adjacency) const;

  std::vector<Bits> outbound_ {};
  std::vector<Bits> inbound_ {};
  Bits top_level_ {};
  Bits bottom_level_ {};
};

} // namespace bitgraph::core
