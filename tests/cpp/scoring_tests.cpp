#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include <vector>
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/scoring.hpp"
#include "test_utils.hpp"

using namespace bitgraph::core;
using namespace bitgraph::core::test;

TEST(PageRank, EmptyGraph) {
  EXPECT_TRUE(page_rank(Graph()).empty());
  EXPECT_TRUE(eigenvector_centrality(Graph()).empty());
}

TEST(PageRank, SymmetricCycleIsUniform) {
  auto ranks = page_rank(make_circle_graph(4));
  ASSERT_EQ(ranks.size(), 4u);
  for (double r : ranks) EXPECT_NEAR(r, 0.25, 1e-9);
}

TEST(PageRank, SumsToOneWithDanglingNodes) {
  auto ranks = page_rank(make_graph(edges_1()));
  ASSERT_EQ(ranks.size(), 32u);
  double total = std::accumulate(ranks.begin(), ranks.end(), 0.0);
  EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST(PageRank, MostLinkedToRanksHighest) {
  auto ranks = page_rank(make_graph({{1, 0}, {2, 0}, {3, 0}, {3, 1}}));
  EXPECT_GT(ranks[0], ranks[1]);
  EXPECT_GT(ranks[1], ranks[2]);
  EXPECT_NEAR(ranks[2], ranks[3], 1e-12);
}

TEST(PageRank, FacadeMatchesFreeFunction) {
  auto g = make_graph(edges_with_cycles());
  PageRankOptions opts;
  opts.damping_factor = 0.5;
  EXPECT_EQ(g.page_rank(opts.min_difference, 0.5, opts.max_iterations, opts.normalize),
            page_rank(g, opts));
}

TEST(PageRank, InvalidOptionsThrow) {
  auto g = make_line_graph(3);
  PageRankOptions opts;
  opts.damping_factor = 1.5;
  EXPECT_THROW((void)page_rank(g, opts), InvalidArgument);
  opts.damping_factor = 0.85;
  opts.max_iterations = -1;
  EXPECT_THROW((void)page_rank(g, opts), InvalidArgument);
}

TEST(EigenvectorCentrality, SymmetricCycleIsUniform) {
  auto scores = eigenvector_centrality(make_circle_graph(4));
  ASSERT_EQ(scores.size(), 4u);
  for (double s : scores) EXPECT_NEAR(s, 0.5, 1e-9);
}

TEST(EigenvectorCentrality, SelfEdges) {
  auto g = make_graph({{0, 1}, {1, 2}, {2, 0}, {0, 0}});
  auto ignored = eigenvector_centrality(g);
  for (double s : ignored) EXPECT_NEAR(s, 1.0 / std::sqrt(3.0), 1e-6);

  EigenvectorCentralityOptions opts;
  opts.ignore_self_edges = false;
  auto counted = eigenvector_centrality(g, opts);
  EXPECT_GT(counted[0], counted[1]);
  EXPECT_NEAR(counted[1], counted[2], 1e-9);
}

TEST(EigenvectorCentrality, L1Normalization) {
  EigenvectorCentralityOptions opts;
  opts.normalize = false;
  auto scores = eigenvector_centrality(make_circle_graph(5), opts);
  double total = std::accumulate(scores.begin(), scores.end(), 0.0);
  EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST(EigenvectorCentrality, FacadeMatchesFreeFunction) {
  auto g = make_graph({{0, 1}, {1, 2}, {2, 0}, {0, 0}});
  EigenvectorCentralityOptions opts;
  opts.use_in_edges = true;
  EXPECT_EQ(g.eigenvector_centrality(opts.max_iterations, opts.min_difference, true,
                                     opts.ignore_self_edges, opts.normalize),
            eigenvector_centrality(g, opts));
}

TEST(EigenvectorCentrality, InvalidOptionsThrow) {
  EigenvectorCentralityOptions opts;
  opts.min_difference = -1.0;
  EXPECT_THROW((void)eigenvector_centrality(make_line_graph(2), opts), InvalidArgument);
}
