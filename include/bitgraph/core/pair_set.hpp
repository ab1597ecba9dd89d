/* PairSet: dense set of directed (x, y) node pairs backed by one N*N bit matrix. */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "bitgraph/core/types.hpp"

namespace bitgraph::core {

class Graph;

// PairSet trades space for O(1) membership: pair (x, y) lives at bit
// x + y * size. It is used as the visited-edge set during path enumeration
// and as a dense materialization of a graph's whole edge relation.
class PairSet {
public:
  explicit PairSet(std::int32_t size);

  [[nodiscard]] static PairSet from_pairs(std::int32_t size, std::span<const Edge> pairs);

  PairSet& add(NodeId x, NodeId y);
  PairSet& remove(NodeId x, NodeId y);
  [[nodiscard]] bool contains(NodeId x, NodeId y) const;

  [[nodiscard]] std::int32_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t pair_count() const noexcept { return bits_.count(); }
  [[nodiscard]] bool empty() const noexcept { return bits_.none(); }

  [[nodiscard]] PairSet copy() const { return *this; }
  // Every pair of the size*size matrix not in this set.
  [[nodiscard]] PairSet inverse() const;
  [[nodiscard]] PairSet retain_all(const PairSet& other) const;
  [[nodiscard]] PairSet removing_all(const PairSet& other) const;
  [[nodiscard]] bool intersects(const PairSet& other) const;

  // Visits pairs in ascending bit position; returns the number visited.
  std::size_t for_each(const EdgeConsumer& consumer) const;
  [[nodiscard]] std::vector<Edge> pairs() const;

  [[nodiscard]] Graph to_graph() const;

  // "0,1 | 2,3"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const PairSet& a, const PairSet& b) noexcept {
    return a.size_ == b.size_ && a.bits_ == b.bits_;
  }

private:
  PairSet(std::int32_t size, Bits bits) : size_(size), bits_(std::move(bits)) {}

  [[nodiscard]] std::size_t position_of(NodeId x, NodeId y) const;
  void check_compatible(const PairSet& other) const;

  std::int32_t size_ {0};
  Bits bits_ {};
};

} // namespace bitgraph::core
