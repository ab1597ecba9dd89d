#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/path.hpp"
#include "test_utils.hpp"

using namespace bitgraph::core;
using namespace bitgraph::core::test;

TEST(Path, BasicAccessors) {
  Path p{3, 1, 4};
  EXPECT_EQ(p.size(), 3u);
  EXPECT_EQ(p.start(), 3);
  EXPECT_EQ(p.end(), 4);
  EXPECT_EQ(p.get(1), 1);
  EXPECT_EQ(p.index_of(4), 2);
  EXPECT_EQ(p.index_of(9), -1);
  EXPECT_EQ(p.to_string(), "3,1,4");
  EXPECT_THROW((void)p.get(3), IndexOutOfRange);
}

TEST(Path, EmptyPath) {
  Path p;
  EXPECT_TRUE(p.empty());
  EXPECT_EQ(p.start(), -1);
  EXPECT_EQ(p.end(), -1);
  EXPECT_TRUE(p.parent_path().empty());
  EXPECT_TRUE(p.child_path().empty());
  EXPECT_EQ(p.to_string(), "");
}

TEST(Path, DerivedPaths) {
  Path p{0, 1, 2};
  EXPECT_EQ(nodes_of(p.reversed()), std::vector<NodeId>({2, 1, 0}));
  EXPECT_EQ(nodes_of(p.parent_path()), std::vector<NodeId>({0, 1}));
  EXPECT_EQ(nodes_of(p.child_path()), std::vector<NodeId>({1, 2}));
  EXPECT_EQ(nodes_of(p), std::vector<NodeId>({0, 1, 2}));
}

TEST(Path, ContainsChecksEveryPosition) {
  Path p{0, 1, 2, 3};
  EXPECT_TRUE(p.contains(Path{0, 1}));
  EXPECT_TRUE(p.contains(Path{2, 3}));
  EXPECT_TRUE(p.contains(Path{1, 2, 3}));
  EXPECT_TRUE(p.contains(Path{}));
  EXPECT_FALSE(p.contains(Path{1, 3}));
  EXPECT_FALSE(p.contains(Path{0, 1, 2, 3, 4}));
  EXPECT_TRUE(p.contains(3));
  EXPECT_FALSE(p.contains(7));
}

TEST(Path, EmptyPathIsContainedEverywhere) {
  EXPECT_TRUE(Path{}.contains(Path{}));
  EXPECT_TRUE(Path{4}.contains(Path{}));
  EXPECT_FALSE(Path{}.contains(Path{4}));
}

TEST(Path, AppendAndReplace) {
  Path p{0, 1};
  p.add(2).append(Path{3, 4});
  EXPECT_EQ(nodes_of(p), std::vector<NodeId>({0, 1, 2, 3, 4}));
  p.replace(2, Path{9});
  EXPECT_EQ(nodes_of(p), std::vector<NodeId>({0, 1, 9}));
  p.replace(3, Path{7});
  EXPECT_EQ(nodes_of(p), std::vector<NodeId>({0, 1, 9, 7}));
  EXPECT_THROW(p.replace(5, Path{1}), IndexOutOfRange);
}

TEST(Path, AppendToItself) {
  Path p{1, 2};
  p.append(p);
  EXPECT_EQ(nodes_of(p), std::vector<NodeId>({1, 2, 1, 2}));
}

TEST(Path, CopyIsIndependent) {
  Path p{1, 2};
  Path q = p.copy();
  q.add(3);
  EXPECT_EQ(p.size(), 2u);
  EXPECT_EQ(q.size(), 3u);
}

TEST(Path, OrdersByLengthThenElements) {
  std::vector<Path> paths = {Path{0, 2, 1}, Path{5}, Path{0, 1, 9}, Path{3, 0}};
  std::sort(paths.begin(), paths.end());
  EXPECT_EQ(nodes_of(paths), (std::vector<std::vector<NodeId>>{{5}, {3, 0}, {0, 1, 9}, {0, 2, 1}}));
  EXPECT_TRUE(Path({9, 9}) < Path({0, 0, 0}));
  EXPECT_EQ(Path({1, 2}), Path({1, 2}));
}
