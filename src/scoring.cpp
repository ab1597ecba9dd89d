/*
  scoring: iterative node scores over a Graph.

  Both algorithms only read the per-node edge sets; they start from a uniform
  distribution and refine until the summed absolute change of a round is at
  most min_difference or max_iterations rounds have run.
*/
#include "bitgraph/core/scoring.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/error.hpp"

namespace bitgraph::core {

void EigenvectorCentralityOptions::validate() const {
  if (max_iterations < 0) {
    throw InvalidArgument("EigenvectorCentralityOptions: max_iterations must be >= 0");
  }
  if (!(min_difference >= 0.0)) {
    throw InvalidArgument("EigenvectorCentralityOptions: min_difference must be >= 0");
  }
}

void PageRankOptions::validate() const {
  if (max_iterations < 0) {
    throw InvalidArgument("PageRankOptions: max_iterations must be >= 0");
  }
  if (!(min_difference >= 0.0)) {
    throw InvalidArgument("PageRankOptions: min_difference must be >= 0");
  }
  if (!(damping_factor >= 0.0 && damping_factor <= 1.0)) {
    throw InvalidArgument("PageRankOptions: damping_factor must be within [0, 1], got "
                          + std::to_string(damping_factor));
  }
}

std::vector<double> eigenvector_centrality(const Graph& g, const EigenvectorCentralityOptions& opts) {
  opts.validate();
  const auto n = static_cast<std::size_t>(g.num_nodes());
  if (n == 0) return {};
  std::vector<double> centrality(n, 1.0 / static_cast<double>(n));
  std::vector<double> unnormalized(n, 0.0);
  for (int iter = 0; iter < opts.max_iterations; ++iter) {
    for (std::size_t i = 0; i < n; ++i) {
      auto node = static_cast<NodeId>(i);
      Bits dests = opts.use_in_edges ? g.parents(node) : g.neighbors(node);
      if (opts.ignore_self_edges) dests.reset(i);
      double sum = 0.0;
      for_each_set_bit(dests, [&](NodeId j) { sum += centrality[static_cast<std::size_t>(j)]; });
      unnormalized[i] = sum;
    }
    double norm = 0.0;
    for (double v : unnormalized) norm += opts.normalize ? v * v : v;
    if (opts.normalize) norm = std::sqrt(norm);
    const double scale = norm == 0.0 ? 1.0 : 1.0 / norm;
    double diff = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      double val = unnormalized[i] * scale;
      diff += std::abs(centrality[i] - val);
      centrality[i] = val;
    }
    if (diff <= opts.min_difference) break;
  }
  return centrality;
}

std::vector<double> page_rank(const Graph& g, const PageRankOptions& opts) {
  opts.validate();
  const auto n = static_cast<std::size_t>(g.num_nodes());
  if (n == 0) return {};
  const double nd = static_cast<double>(n);
  const double d = opts.damping_factor;
  std::vector<double> rank(n, 1.0 / nd);
  std::vector<double> next(n, 0.0);
  std::vector<double> out_degree(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    out_degree[i] = static_cast<double>(g.outbound_reference_count(static_cast<NodeId>(i)));
  }
  for (int iter = 0; iter < opts.max_iterations; ++iter) {
    double dangling = 0.0;
    if (opts.normalize) {
      for (std::size_t i = 0; i < n; ++i) {
        if (out_degree[i] == 0.0) dangling += rank[i];
      }
      dangling *= d / nd;
    }
    double diff = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      double input = 0.0;
      for_each_set_bit(g.parents(static_cast<NodeId>(i)), [&](NodeId j) {
        auto ju = static_cast<std::size_t>(j);
        input += rank[ju] / out_degree[ju];
      });
      next[i] = (1.0 - d) / nd + d * input + dangling;
      diff += std::abs(next[i] - rank[i]);
    }
    rank.swap(next);
    if (diff <= opts.min_difference) break;
  }
  return rank;
}

} // namespace bitgraph::core
