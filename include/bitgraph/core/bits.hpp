/*
  Helpers over Bits (boost::dynamic_bitset): set-bit enumeration with early
  exit, conversion to node lists, and the byte encoding used by the graph
  dump format.
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "bitgraph/core/types.hpp"

namespace bitgraph::core {

// Empty set sized for n nodes.
[[nodiscard]] inline Bits make_bits(std::size_t n) { return Bits(n); }

// Index of the first set bit at or after `from`, or -1.
[[nodiscard]] inline NodeId next_set_bit(const Bits& b, std::size_t from) noexcept {
  if (from >= b.size()) return -1;
  auto pos = (from == 0) ? b.find_first() : b.find_next(from - 1);
  return pos == Bits::npos ? -1 : static_cast<NodeId>(pos);
}

template <typename F>
void for_each_set_bit(const Bits& b, F&& fn) {
  for (auto pos = b.find_first(); pos != Bits::npos; pos = b.find_next(pos)) {
    fn(static_cast<NodeId>(pos));
  }
}

template <typename F>
void for_each_set_bit_descending(const Bits& b, F&& fn) {
  for (std::size_t i = b.size(); i-- > 0;) {
    if (b.test(i)) fn(static_cast<NodeId>(i));
  }
}

// Calls pred for each set bit ascending until it returns false. Returns the
// bit at which enumeration stopped, or -1 if every bit was visited.
template <typename Pred>
NodeId for_each_set_bit_until(const Bits& b, Pred&& pred) {
  for (auto pos = b.find_first(); pos != Bits::npos; pos = b.find_next(pos)) {
    if (!pred(static_cast<NodeId>(pos))) return static_cast<NodeId>(pos);
  }
  return -1;
}

[[nodiscard]] std::vector<NodeId> bits_to_vector(const Bits& b);

// Set for n nodes with the given ids set; ids must be in [0, n).
[[nodiscard]] Bits bits_of(std::size_t n, std::span<const NodeId> ids);

// "{1, 2, 5}"
[[nodiscard]] std::string bits_to_string(const Bits& b);

// Little-endian byte encoding: byte k bit j holds bit 8k+j. Trailing zero
// bytes are trimmed, so an empty set encodes to zero bytes.
[[nodiscard]] std::vector<std::uint8_t> bits_to_bytes(const Bits& b);

// Decode into a set of exactly n bits. Throws InvalidArgument if the encoding
// names a bit at or above n.
[[nodiscard]] Bits bits_from_bytes(std::span<const std::uint8_t> bytes, std::size_t n);

} // namespace bitgraph::core
