/*
  Bits helpers: node-list conversion and the little-endian byte encoding
  used by Graph::save()/load().
*/
#include "bitgraph/core/bits.hpp"

#include <sstream>
#include <string>

#include "bitgraph/core/error.hpp"

namespace bitgraph::core {

std::vector<NodeId> bits_to_vector(const Bits& b) {
  std::vector<NodeId> out;
  out.reserve(b.count());
  for_each_set_bit(b, [&](NodeId n) { out.push_back(n); });
  return out;
}

Bits bits_of(std::size_t n, std::span<const NodeId> ids) {
  Bits out(n);
  for (auto id : ids) {
    if (id < 0 || static_cast<std::size_t>(id) >= n) {
      throw IndexOutOfRange("bits_of: id " + std::to_string(id) + " out of range of " + std::to_string(n));
    }
    out.set(static_cast<std::size_t>(id));
  }
  return out;
}

std::string bits_to_string(const Bits& b) {
  std::ostringstream os;
  os << '{';
  bool first = true;
  for_each_set_bit(b, [&](NodeId n) {
    if (!first) os << ", ";
    os << n;
    first = false;
  });
  os << '}';
  return os.str();
}

std::vector<std::uint8_t> bits_to_bytes(const Bits& b) {
  std::vector<std::uint8_t> out;
  auto last = b.find_first();
  if (last == Bits::npos) return out;
  // Highest set bit determines the encoded length.
  for (auto pos = last; pos != Bits::npos; pos = b.find_next(pos)) last = pos;
  out.assign(last / 8 + 1, 0);
  for_each_set_bit(b, [&](NodeId n) {
    auto i = static_cast<std::size_t>(n);
    out[i / 8] = static_cast<std::uint8_t>(out[i / 8] | (1u << (i % 8)));
  });
  return out;
}

Bits bits_from_bytes(std::span<const std::uint8_t> bytes, std::size_t n) {
  Bits out(n);
  for (std::size_t k = 0; k < bytes.size(); ++k) {
    auto byte = bytes[k];
    if (byte == 0) continue;
    for (unsigned j = 0; j < 8; ++j) {
      if ((byte & (1u << j)) == 0) continue;
      std::size_t bit = k * 8 + j;
      if (bit >= n) {
        throw InvalidArgument("bits_from_bytes: encoded bit " + std::to_string(bit)
                              + " exceeds set size " + std::to_string(n));
      }
      out.set(bit);
    }
  }
  return out;
}

} // namespace bitgraph::core
