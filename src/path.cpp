#include "bitgraph/core/path.hpp"

#include <algorithm>
#include <sstream>
#include <string>

#include "bitgraph/core/error.hpp"

namespace bitgraph::core {

Path& Path::add(NodeId node) {
  items_.push_back(node);
  return *this;
}

Path& Path::add_all(std::span<const NodeId> nodes) {
  items_.insert(items_.end(), nodes.begin(), nodes.end());
  return *this;
}

Path& Path::append(const Path& other) {
  // Copy first so that p.append(p) is well defined.
  std::vector<NodeId> tail(other.items_);
  items_.insert(items_.end(), tail.begin(), tail.end());
  return *this;
}

Path& Path::replace(std::size_t index, const Path& other) {
  if (index > items_.size()) {
    throw IndexOutOfRange("Path::replace: index " + std::to_string(index)
                          + " beyond size " + std::to_string(items_.size()));
  }
  std::vector<NodeId> tail(other.items_);
  items_.resize(index);
  items_.insert(items_.end(), tail.begin(), tail.end());
  return *this;
}

Path Path::reversed() const {
  return Path(std::vector<NodeId>(items_.rbegin(), items_.rend()));
}

Path Path::parent_path() const {
  if (items_.empty()) return *this;
  return Path(std::vector<NodeId>(items_.begin(), items_.end() - 1));
}

Path Path::child_path() const {
  if (items_.empty()) return *this;
  return Path(std::vector<NodeId>(items_.begin() + 1, items_.end()));
}

bool Path::contains(const Path& other) const noexcept {
  if (other.items_.empty()) return true;
  if (other.items_.size() > items_.size()) return false;
  return std::search(items_.begin(), items_.end(),
                     other.items_.begin(), other.items_.end()) != items_.end();
}

bool Path::contains(NodeId node) const noexcept {
  return index_of(node) >= 0;
}

int Path::index_of(NodeId node) const noexcept {
  auto it = std::find(items_.begin(), items_.end(), node);
  return it == items_.end() ? -1 : static_cast<int>(it - items_.begin());
}

NodeId Path::get(std::size_t index) const {
  if (index >= items_.size()) {
    throw IndexOutOfRange("Path::get: " + std::to_string(index) + " of " + std::to_string(items_.size()));
  }
  return items_[index];
}

std::string Path::to_string() const {
  std::ostringstream os;
  for (std::size_t i = 0; i < items_.size(); ++i) {
    if (i) os << ',';
    os << items_[i];
  }
  return os.str();
}

std::strong_ordering operator<=>(const Path& a, const Path& b) noexcept {
  if (auto c = a.items_.size() <=> b.items_.size(); c != 0) return c;
  return std::lexicographical_compare_three_way(a.items_.begin(), a.items_.end(),
                                                b.items_.begin(), b.items_.end());
}

} // namespace bitgraph::core
