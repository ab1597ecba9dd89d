/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 (matches np.int32)
 * - Bits: growable bit vector (boost::dynamic_bitset), one per node edge set
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include <boost/dynamic_bitset.hpp>

namespace bitgraph::core {

// Node identifiers are signed 32-bit integers in [0, N).
using NodeId = std::int32_t;

// Per-node edge set; bit j of outbound[i] is set iff there is an edge i -> j.
using Bits = boost::dynamic_bitset<>;

// A directed edge (from, to).
using Edge = std::pair<NodeId, NodeId>;

// Which edge set a search follows.
enum class Direction {
  Down = 1,  // outbound edges (successors)
  Up = 2     // inbound edges (predecessors)
};

// Callbacks used by traversal and enumeration.
using NodeConsumer = std::function<void(NodeId)>;
using NodePredicate = std::function<bool(NodeId)>;
using EdgeConsumer = std::function<void(NodeId, NodeId)>;

// Visitor for walk()/walk_upwards(): enter() is called pre-order and exit()
// post-order, with the depth relative to the seed node.
class GraphVisitor {
public:
  virtual ~GraphVisitor() noexcept = default;
  virtual void enter(NodeId node, int depth) = 0;
  virtual void exit(NodeId node, int depth) { (void)node; (void)depth; }
};

} // namespace bitgraph::core
