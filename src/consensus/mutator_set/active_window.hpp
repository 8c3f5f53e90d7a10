#pragma once

#include <cstdint>
#include <vector>

#include "consensus/mutator_set/chunk.hpp"
#include "primitives/hash.hpp"

namespace veil::mutator_set {

// The not-yet-committed part of the bloom filter. Positions are relative to
// the window start and lie in [0, kWindowSize).
class ActiveWindow {
 public:
  ActiveWindow() = default;
  explicit ActiveWindow(std::vector<std::uint32_t> relative_indices);

  bool Contains(std::uint32_t index) const;
  bool Insert(std::uint32_t index);
  bool Remove(std::uint32_t index);

  // Bits that will become the next committed chunk.
  Chunk FirstChunk() const;
  // Removes the first chunk's bits and shifts the rest down by one chunk.
  Chunk Slide();
  // Inverse of Slide(). Fails if the top chunk of the window is occupied.
  bool SlideBack(const Chunk& chunk);

  const std::vector<std::uint32_t>& RelativeIndices() const noexcept { return indices_; }
  primitives::Hash256 Hash() const;

  bool operator==(const ActiveWindow& other) const = default;

 private:
  std::vector<std::uint32_t> indices_;
};

}  // namespace veil::mutator_set
