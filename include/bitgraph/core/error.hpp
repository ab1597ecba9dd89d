#pragma once

#include <stdexcept>
#include <string>

namespace bitgraph::core {

// A node id (or pair coordinate, or path index) outside the valid range.
struct IndexOutOfRange : public std::out_of_range {
  using std::out_of_range::out_of_range;
};

// Violated precondition: mismatched arrays, mirror inconsistency, duplicate
// ids, invalid options or corrupt serialized data.
struct InvalidArgument : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct UnsupportedFormatVersion : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace bitgraph::core
