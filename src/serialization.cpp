/*
  serialization: versioned binary dump of a Graph's outbound edge sets.

  Layout (all integers big-endian int32):
    version (1) | node count N | N x { byte length, or -1 for an empty set;
                                       then the bits_to_bytes() encoding }
  Inbound sets are never stored; load() rebuilds them as the inverse.
*/
#include <array>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/debug_log.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"

namespace bitgraph::core {

namespace {

constexpr std::int32_t kFormatVersion = 1;

void write_i32(std::ostream& out, std::int32_t value) {
  auto u = static_cast<std::uint32_t>(value);
  std::array<char, 4> buf {
    static_cast<char>((u >> 24) & 0xFF), static_cast<char>((u >> 16) & 0xFF),
    static_cast<char>((u >> 8) & 0xFF), static_cast<char>(u & 0xFF)
  };
  out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
}

std::int32_t read_i32(std::istream& in, const char* what) {
  std::array<unsigned char, 4> buf {};
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (in.gcount() != static_cast<std::streamsize>(buf.size())) {
    throw InvalidArgument(std::string("Graph::load: truncated input reading ") + what);
  }
  std::uint32_t u = (static_cast<std::uint32_t>(buf[0]) << 24) | (static_cast<std::uint32_t>(buf[1]) << 16)
                  | (static_cast<std::uint32_t>(buf[2]) << 8) | static_cast<std::uint32_t>(buf[3]);
  return static_cast<std::int32_t>(u);
}

// Bytes left in a seekable stream, or -1 when the stream cannot tell.
std::streamoff remaining_bytes(std::istream& in) {
  const auto here = in.tellg();
  if (here == std::streampos(-1)) {
    in.clear();
    return -1;
  }
  in.seekg(0, std::ios::end);
  const auto end = in.tellg();
  in.clear();
  in.seekg(here);
  if (end == std::streampos(-1)) return -1;
  return static_cast<std::streamoff>(end - here);
}

} // namespace

void Graph::save(std::ostream& out) const {
  write_i32(out, kFormatVersion);
  write_i32(out, num_nodes());
  for (const auto& set : outbound_) {
    if (set.none()) {
      write_i32(out, -1);
      continue;
    }
    auto bytes = bits_to_bytes(set);
    write_i32(out, static_cast<std::int32_t>(bytes.size()));
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("Graph::save: stream write failed");
  }
}

Graph Graph::load(std::istream& in) {
  auto version = read_i32(in, "version");
  if (version != kFormatVersion) {
    throw UnsupportedFormatVersion("Graph::load: unsupported format version " + std::to_string(version));
  }
  auto count = read_i32(in, "node count");
  if (count < 0) {
    throw InvalidArgument("Graph::load: negative node count " + std::to_string(count));
  }
  const auto n = static_cast<std::size_t>(count);
  // Every node takes at least its 4-byte length field, so a count the input
  // cannot hold is rejected before anything is sized from it.
  const auto left = remaining_bytes(in);
  if (left >= 0 && static_cast<std::size_t>(left) / 4 < n) {
    throw InvalidArgument("Graph::load: node count " + std::to_string(count)
                          + " exceeds the remaining input");
  }
  const auto max_bytes = (n + 7) / 8;
  std::vector<Bits> outbound;
  std::vector<std::uint8_t> bytes;
  for (std::size_t i = 0; i < n; ++i) {
    auto len = read_i32(in, "edge set length");
    if (len == -1) {
      // from_edges() sizes it to n
      outbound.emplace_back();
      continue;
    }
    if (len < 0 || static_cast<std::size_t>(len) > max_bytes) {
      throw InvalidArgument("Graph::load: node " + std::to_string(i) + " has invalid encoding length "
                            + std::to_string(len));
    }
    bytes.resize(static_cast<std::size_t>(len));
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(len));
    if (in.gcount() != static_cast<std::streamsize>(len)) {
      throw InvalidArgument("Graph::load: truncated edge set for node " + std::to_string(i));
    }
    outbound.push_back(bits_from_bytes(bytes, n));
  }
  BITGRAPH_DEBUG_LOG("Graph::load: %zu nodes", n);
  return Graph::from_edges(std::move(outbound));
}

std::vector<std::uint8_t> Graph::to_bytes() const {
  std::ostringstream os(std::ios::binary);
  save(os);
  const auto s = os.str();
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

Graph Graph::from_bytes(std::span<const std::uint8_t> bytes) {
  std::istringstream is(std::string(bytes.begin(), bytes.end()), std::ios::binary);
  return load(is);
}

} // namespace bitgraph::core
