/* Node scoring: eigenvector centrality and page rank over a Graph. */
#pragma once

#include <vector>

#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/options.hpp"

namespace bitgraph::core {

// Both functions validate their options and return one score per node
// (index = node id). An empty graph yields an empty vector.
[[nodiscard]] std::vector<double> eigenvector_centrality(
    const Graph& g, const EigenvectorCentralityOptions& opts = {});

[[nodiscard]] std::vector<double> page_rank(
    const Graph& g, const PageRankOptions& opts = {});

} // namespace bitgraph::core
