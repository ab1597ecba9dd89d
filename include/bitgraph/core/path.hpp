/* Path: ordered sequence of node ids with structural operations. */
#pragma once

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include "bitgraph/core/types.hpp"

namespace bitgraph::core {

// A Path is an ordered, possibly repeating sequence of nodes. Paths order by
// length first, then element-wise, so sorting a collection of paths puts the
// shortest first. Mutating operations return *this for chaining; reversed(),
// parent_path() and child_path() produce new paths.
class Path {
public:
  Path() = default;
  Path(std::initializer_list<NodeId> nodes) : items_(nodes) {}
  explicit Path(std::vector<NodeId> nodes) : items_(std::move(nodes)) {}

  Path& add(NodeId node);
  Path& add_all(std::span<const NodeId> nodes);
  Path& append(const Path& other);
  // Truncate to `index` elements, then append `other`.
  Path& replace(std::size_t index, const Path& other);

  [[nodiscard]] Path copy() const { return *this; }
  [[nodiscard]] Path reversed() const;
  // Drops the last element; an empty path stays empty.
  [[nodiscard]] Path parent_path() const;
  // Drops the first element; an empty path stays empty.
  [[nodiscard]] Path child_path() const;

  // True if `other` occurs as a contiguous run within this path.
  [[nodiscard]] bool contains(const Path& other) const noexcept;
  [[nodiscard]] bool contains(NodeId node) const noexcept;
  [[nodiscard]] int index_of(NodeId node) const noexcept;

  [[nodiscard]] NodeId start() const noexcept { return items_.empty() ? -1 : items_.front(); }
  [[nodiscard]] NodeId end() const noexcept { return items_.empty() ? -1 : items_.back(); }
  [[nodiscard]] NodeId get(std::size_t index) const;
  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] std::span<const NodeId> items() const noexcept { return items_; }

  // "0,1,2"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Path& a, const Path& b) noexcept { return a.items_ == b.items_; }
  friend std::strong_ordering operator<=>(const Path& a, const Path& b) noexcept;

private:
  std::vector<NodeId> items_ {};
};

} // namespace bitgraph::core
