#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "primitives/hash.hpp"

namespace veil::mutator_set {

// Additions per window slide.
inline constexpr std::uint64_t kBatchSize = 8;
// Bits per committed chunk; the window moves by one chunk per batch.
inline constexpr std::uint64_t kChunkSize = 4096;
inline constexpr std::uint64_t kWindowSize = 1ULL << 20;
// Bloom filter indices derived per item.
inline constexpr std::size_t kNumTrials = 45;

using AbsoluteIndices = std::array<std::uint64_t, kNumTrials>;

inline constexpr std::uint64_t BatchIndex(std::uint64_t aocl_leaf_index) noexcept {
  return aocl_leaf_index / kBatchSize;
}

// True when adding the item with this AOCL leaf index moves the window.
inline constexpr bool WindowSlides(std::uint64_t added_leaf_index) noexcept {
  return added_leaf_index != 0 && added_leaf_index % kBatchSize == 0;
}

// Number of chunks folded into the inactive part after `aocl_leaf_count`
// additions; equals the inactive MMR's leaf count.
inline constexpr std::uint64_t SlidChunkCount(std::uint64_t aocl_leaf_count) noexcept {
  return aocl_leaf_count == 0 ? 0 : (aocl_leaf_count - 1) / kBatchSize;
}

primitives::Hash256 ReceiverDigest(const primitives::Hash256& receiver_preimage);

primitives::Hash256 ComputeCommitment(const primitives::Hash256& item,
                                      const primitives::Hash256& sender_randomness,
                                      const primitives::Hash256& receiver_digest);

// Deterministic, sorted, pairwise-distinct bloom filter indices of an item
// added at `aocl_leaf_index`. All indices lie inside the window that was
// active when the item was added.
AbsoluteIndices GetSwbfIndices(const primitives::Hash256& item,
                               const primitives::Hash256& sender_randomness,
                               const primitives::Hash256& receiver_preimage,
                               std::uint64_t aocl_leaf_index);

}  // namespace veil::mutator_set
