#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"

namespace veil::mutator_set {

primitives::Hash256 HashMmrNode(const primitives::Hash256& left,
                                const primitives::Hash256& right);

// Commits to an ordered peak list and the leaf count it describes.
primitives::Hash256 BagPeaks(const std::vector<primitives::Hash256>& peaks,
                             std::uint64_t leaf_count);

// Finds the perfect subtree holding `leaf_index` in an MMR of `leaf_count`
// leaves. Peaks are ordered tallest (leftmost) first.
bool LocateLeaf(std::uint64_t leaf_count, std::uint64_t leaf_index,
                std::size_t* peak_index, std::uint32_t* tree_height);

struct MmrMembershipProof {
  std::uint64_t leaf_index{0};
  // Siblings from the leaf level up to (excluding) the peak.
  std::vector<primitives::Hash256> authentication_path;

  bool operator==(const MmrMembershipProof& other) const = default;

  primitives::Hash256 ComputePeak(const primitives::Hash256& leaf) const;
  bool Verify(const primitives::Hash256& leaf, const std::vector<primitives::Hash256>& peaks,
              std::uint64_t leaf_count) const;

  // Keeps the proof valid after `new_leaf` is appended to an MMR that had
  // `old_leaf_count` leaves and `old_peaks`.
  void UpdateFromAppend(std::uint64_t old_leaf_count, const primitives::Hash256& new_leaf,
                        const std::vector<primitives::Hash256>& old_peaks);

  // Keeps the proof valid after the leaf proven by `mutated` (valid before the
  // mutation) changes to `new_leaf`. Returns true if the path changed.
  bool UpdateFromLeafMutation(const MmrMembershipProof& mutated,
                              const primitives::Hash256& new_leaf);
};

// Peaks-only MMR. Enough to verify proofs, append, and mutate leaves whose
// proofs the caller supplies.
class MmrAccumulator {
 public:
  MmrAccumulator() = default;
  MmrAccumulator(std::vector<primitives::Hash256> peaks, std::uint64_t leaf_count);

  std::uint64_t LeafCount() const noexcept { return leaf_count_; }
  const std::vector<primitives::Hash256>& Peaks() const noexcept { return peaks_; }
  primitives::Hash256 Bag() const { return BagPeaks(peaks_, leaf_count_); }

  // Appends and returns the membership proof of the new leaf.
  MmrMembershipProof Append(const primitives::Hash256& leaf);
  bool MutateLeaf(const MmrMembershipProof& proof, const primitives::Hash256& new_leaf);
  bool Verify(const MmrMembershipProof& proof, const primitives::Hash256& leaf) const;

  bool operator==(const MmrAccumulator& other) const = default;

 private:
  std::vector<primitives::Hash256> peaks_;
  std::uint64_t leaf_count_{0};
};

// MMR that keeps every node so it can produce proofs for any leaf and undo
// appends.
class ArchivalMmr {
 public:
  std::uint64_t LeafCount() const noexcept {
    return levels_.empty() ? 0 : static_cast<std::uint64_t>(levels_[0].size());
  }
  void Append(const primitives::Hash256& leaf);
  bool RemoveLast(primitives::Hash256* removed);
  bool MutateLeaf(std::uint64_t leaf_index, const primitives::Hash256& new_leaf);
  bool GetLeaf(std::uint64_t leaf_index, primitives::Hash256* leaf) const;
  bool Prove(std::uint64_t leaf_index, MmrMembershipProof* proof) const;
  std::vector<primitives::Hash256> Peaks() const;
  MmrAccumulator ToAccumulator() const { return MmrAccumulator(Peaks(), LeafCount()); }
  const std::vector<primitives::Hash256>& Leaves() const;

 private:
  // levels_[h][i] is the root of the perfect subtree of height h covering
  // leaves [i * 2^h, (i + 1) * 2^h). Only complete subtrees are stored.
  std::vector<std::vector<primitives::Hash256>> levels_;
};

}  // namespace veil::mutator_set
