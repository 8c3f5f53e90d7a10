#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"

namespace veil::mutator_set {

// One committed slice of the sliding-window bloom filter. Stores the set bit
// positions (relative to the chunk start) in ascending order.
struct Chunk {
  std::vector<std::uint32_t> relative_indices;

  bool operator==(const Chunk& other) const = default;

  bool Contains(std::uint32_t index) const;
  // Returns true if the bit was previously unset.
  bool Insert(std::uint32_t index);
  // Returns true if the bit was previously set.
  bool Erase(std::uint32_t index);
  bool Empty() const noexcept { return relative_indices.empty(); }
  primitives::Hash256 Hash() const;
};

}  // namespace veil::mutator_set
