#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "consensus/mutator_set/active_window.hpp"
#include "consensus/mutator_set/chunk.hpp"
#include "consensus/mutator_set/mmr.hpp"
#include "consensus/mutator_set/mutator_set.hpp"

namespace veil::mutator_set {

// Full backend owned by the chain state. Keeps every AOCL leaf and every
// chunk so it can serve membership proofs for old items and undo blocks.
class ArchivalMutatorSet final : public MutatorSet {
 public:
  std::uint64_t AoclLeafCount() const override { return aocl_.LeafCount(); }
  std::vector<primitives::Hash256> AoclPeaks() const override { return aocl_.Peaks(); }
  std::uint64_t SwbfInactiveLeafCount() const override { return swbf_inactive_.LeafCount(); }
  std::vector<primitives::Hash256> SwbfInactivePeaks() const override {
    return swbf_inactive_.Peaks();
  }
  const ActiveWindow& Window() const override { return window_; }

  void Add(const AdditionRecord& record) override;
  bool Remove(const RemovalRecord& record, std::vector<std::uint64_t>* flipped_indices,
              std::string* error) override;

  // Undo the most recent Add(); `record` must match the last AOCL leaf.
  bool RevertAdd(const AdditionRecord& record, std::string* error);
  // Clears bits previously reported as flipped by Remove().
  bool RevertRemove(const std::vector<std::uint64_t>& flipped_indices, std::string* error);

  bool RestoreMembershipProof(const primitives::Hash256& item,
                              const primitives::Hash256& sender_randomness,
                              const primitives::Hash256& receiver_preimage,
                              std::uint64_t aocl_leaf_index, MsMembershipProof* proof,
                              std::string* error) const;
  // Rebuilds the inactive-chunk entries of `record` against this state. The
  // indices are kept, so the record still spends the same output.
  bool RefreshTargetChunks(RemovalRecord* record, std::string* error) const;

  const std::vector<primitives::Hash256>& AoclLeaves() const { return aocl_.Leaves(); }
  const std::vector<Chunk>& Chunks() const noexcept { return chunks_; }

  static bool FromParts(const std::vector<primitives::Hash256>& aocl_leaves,
                        std::vector<Chunk> chunks, ActiveWindow window,
                        ArchivalMutatorSet* out, std::string* error);

 private:
  bool CollectTargetChunks(const AbsoluteIndices& indices, ChunkDictionary* out,
                           std::string* error) const;

  ArchivalMmr aocl_;
  ArchivalMmr swbf_inactive_;
  std::vector<Chunk> chunks_;
  ActiveWindow window_;
};

}  // namespace veil::mutator_set
