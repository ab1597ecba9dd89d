/* Option structs for the scoring algorithms. */
#pragma once

namespace bitgraph::core {

// Eigenvector centrality emphasizes nodes that paths run through.
struct EigenvectorCentralityOptions {
  // Stop after this many refinement rounds.
  int max_iterations { 400 };
  // Stop once the summed absolute change of a round drops to this.
  double min_difference { 0.000001 };
  // Score from inbound edges (parents) instead of all neighbors.
  bool use_in_edges { false };
  // Do not let a node's self-edge contribute to its own score.
  bool ignore_self_edges { true };
  // L2-normalize each round (otherwise L1).
  bool normalize { true };

  // Throws InvalidArgument on negative iteration counts or differences.
  void validate() const;
};

// Page rank favors most-linked-to nodes.
struct PageRankOptions {
  double min_difference { 0.0000000000000004 };
  double damping_factor { 0.85 };
  int max_iterations { 1000 };
  // Redistribute the rank of dangling nodes (no outbound edges) uniformly.
  bool normalize { true };

  // Throws InvalidArgument unless damping_factor is within [0, 1] and the
  // other limits are non-negative.
  void validate() const;
};

} // namespace bitgraph::core
