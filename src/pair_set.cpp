/*
  PairSet: directed pair membership over a single size*size bit vector.
*/
#include "bitgraph/core/pair_set.hpp"

#include <sstream>
#include <string>

#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/graph_builder.hpp"

namespace bitgraph::core {

PairSet::PairSet(std::int32_t size) : size_(size) {
  if (size < 0) {
    throw InvalidArgument("PairSet: size must be >= 0");
  }
  bits_.resize(static_cast<std::size_t>(size) * static_cast<std::size_t>(size));
}

PairSet PairSet::from_pairs(std::int32_t size, std::span<const Edge> pairs) {
  PairSet set(size);
  for (const auto& [x, y] : pairs) set.add(x, y);
  return set;
}

std::size_t PairSet::position_of(NodeId x, NodeId y) const {
  if (x < 0 || y < 0 || x >= size_ || y >= size_) {
    throw IndexOutOfRange("PairSet: pair (" + std::to_string(x) + "," + std::to_string(y)
                          + ") out of range of size " + std::to_string(size_));
  }
  return static_cast<std::size_t>(x) + static_cast<std::size_t>(y) * static_cast<std::size_t>(size_);
}

void PairSet::check_compatible(const PairSet& other) const {
  if (other.size_ != size_) {
    throw InvalidArgument("PairSet: size mismatch " + std::to_string(size_)
                          + " vs " + std::to_string(other.size_));
  }
}

PairSet& PairSet::add(NodeId x, NodeId y) {
  bits_.set(position_of(x, y));
  return *this;
}

PairSet& PairSet::remove(NodeId x, NodeId y) {
  bits_.reset(position_of(x, y));
  return *this;
}

bool PairSet::contains(NodeId x, NodeId y) const {
  return bits_.test(position_of(x, y));
}

PairSet PairSet::inverse() const {
  return PairSet(size_, ~bits_);
}

PairSet PairSet::retain_all(const PairSet& other) const {
  check_compatible(other);
  return PairSet(size_, bits_ & other.bits_);
}

PairSet PairSet::removing_all(const PairSet& other) const {
  check_compatible(other);
  return PairSet(size_, bits_ - other.bits_);
}

bool PairSet::intersects(const PairSet& other) const {
  check_compatible(other);
  return bits_.intersects(other.bits_);
}

std::size_t PairSet::for_each(const EdgeConsumer& consumer) const {
  std::size_t count = 0;
  const auto n = static_cast<std::size_t>(size_);
  // Positions can exceed NodeId range, so walk them as size_t.
  for (auto p = bits_.find_first(); p != Bits::npos; p = bits_.find_next(p)) {
    consumer(static_cast<NodeId>(p % n), static_cast<NodeId>(p / n));
    ++count;
  }
  return count;
}

std::vector<Edge> PairSet::pairs() const {
  std::vector<Edge> out;
  out.reserve(pair_count());
  for_each([&](NodeId x, NodeId y) { out.emplace_back(x, y); });
  return out;
}

Graph PairSet::to_graph() const {
  GraphBuilder builder(size_);
  for_each([&](NodeId x, NodeId y) { builder.add_edge(x, y); });
  return builder.build();
}

std::string PairSet::to_string() const {
  std::ostringstream os;
  bool first = true;
  for_each([&](NodeId x, NodeId y) {
    if (!first) os << " | ";
    os << x << ',' << y;
    first = false;
  });
  return os.str();
}

} // namespace bitgraph::core
