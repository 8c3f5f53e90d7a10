#include "consensus/mutator_set/records.hpp"

#include <algorithm>

#include "consensus/mutator_set/mutator_set.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::mutator_set {

namespace {

bool TouchesChunk(const AbsoluteIndices& indices, std::uint64_t chunk_index) {
  const std::uint64_t begin = chunk_index * kChunkSize;
  const std::uint64_t end = begin + kChunkSize;
  return std::any_of(indices.begin(), indices.end(),
                     [&](std::uint64_t index) { return index >= begin && index < end; });
}

// Data describing the chunk that the next addition folds into the inactive
// MMR. Computed once per addition and shared by every record being updated.
struct SlideUpdate {
  std::uint64_t old_leaf_count{0};
  std::vector<primitives::Hash256> old_peaks;
  Chunk chunk;
  primitives::Hash256 leaf{};
  MmrMembershipProof new_proof;
};

bool ComputeSlideUpdate(const MutatorSet& before, SlideUpdate* out) {
  if (!WindowSlides(before.AoclLeafCount())) {
    return false;
  }
  out->old_leaf_count = before.SwbfInactiveLeafCount();
  out->old_peaks = before.SwbfInactivePeaks();
  out->chunk = before.Window().FirstChunk();
  out->leaf = out->chunk.Hash();
  MmrAccumulator scratch(out->old_peaks, out->old_leaf_count);
  out->new_proof = scratch.Append(out->leaf);
  return true;
}

void ApplySlideUpdate(const SlideUpdate& update, const AbsoluteIndices& indices,
                      ChunkDictionary* chunks) {
  for (auto& [chunk_index, entry] : *chunks) {
    entry.proof.UpdateFromAppend(update.old_leaf_count, update.leaf, update.old_peaks);
  }
  if (TouchesChunk(indices, update.old_leaf_count)) {
    (*chunks)[update.old_leaf_count] = ChunkEntry{update.new_proof, update.chunk};
  }
}

void ApplyRemoveUpdate(const RemovalRecord& applied, const std::vector<ChunkMutation>& mutations,
                       ChunkDictionary* chunks) {
  for (auto index : applied.absolute_indices) {
    const std::uint64_t chunk_index = index / kChunkSize;
    if (applied.target_chunks.count(chunk_index) == 0) {
      continue;
    }
    auto it = chunks->find(chunk_index);
    if (it != chunks->end()) {
      it->second.chunk.Insert(static_cast<std::uint32_t>(index % kChunkSize));
    }
  }
  for (auto& [chunk_index, entry] : *chunks) {
    for (const auto& mutation : mutations) {
      entry.proof.UpdateFromLeafMutation(mutation.proof, mutation.new_leaf);
    }
  }
}

}  // namespace

primitives::Hash256 RemovalRecord::IndexSetDigest() const {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(absolute_indices.size() * 8);
  for (auto index : absolute_indices) {
    primitives::serialize::WriteUint64(&buffer, index);
  }
  const auto digest = crypto::TaggedSha3_256("veil/ms/index-set", {buffer});
  primitives::Hash256 out{};
  std::copy(digest.begin(), digest.end(), out.begin());
  return out;
}

bool RemovalRecord::HasWellFormedIndices() const {
  for (std::size_t i = 1; i < absolute_indices.size(); ++i) {
    if (absolute_indices[i] <= absolute_indices[i - 1]) {
      return false;
    }
  }
  return true;
}

std::vector<ChunkMutation> RemovalRecord::ChunkMutations() const {
  std::vector<ChunkMutation> mutations;
  mutations.reserve(target_chunks.size());
  std::vector<MmrMembershipProof> pending;
  std::vector<primitives::Hash256> new_leaves;
  pending.reserve(target_chunks.size());
  for (const auto& [chunk_index, entry] : target_chunks) {
    Chunk updated = entry.chunk;
    for (auto index : absolute_indices) {
      if (index / kChunkSize == chunk_index) {
        updated.Insert(static_cast<std::uint32_t>(index % kChunkSize));
      }
    }
    pending.push_back(entry.proof);
    new_leaves.push_back(updated.Hash());
  }
  for (std::size_t i = 0; i < pending.size(); ++i) {
    mutations.push_back(ChunkMutation{pending[i], new_leaves[i]});
    for (std::size_t j = i + 1; j < pending.size(); ++j) {
      pending[j].UpdateFromLeafMutation(pending[i], new_leaves[i]);
    }
  }
  return mutations;
}

void RemovalRecord::BatchUpdateFromAddition(const std::vector<RemovalRecord*>& records,
                                            const MutatorSet& before) {
  SlideUpdate update;
  if (!ComputeSlideUpdate(before, &update)) {
    return;
  }
  for (auto* record : records) {
    if (record) {
      ApplySlideUpdate(update, record->absolute_indices, &record->target_chunks);
    }
  }
}

void RemovalRecord::BatchUpdateFromRemove(const std::vector<RemovalRecord*>& records,
                                          const RemovalRecord& applied) {
  const auto mutations = applied.ChunkMutations();
  for (auto* record : records) {
    if (record) {
      ApplyRemoveUpdate(applied, mutations, &record->target_chunks);
    }
  }
}

AbsoluteIndices MsMembershipProof::ComputeIndices(const primitives::Hash256& item) const {
  return GetSwbfIndices(item, sender_randomness, receiver_preimage, auth_path_aocl.leaf_index);
}

void MsMembershipProof::UpdateFromAddition(const primitives::Hash256& own_item,
                                           const MutatorSet& before,
                                           const AdditionRecord& addition) {
  auth_path_aocl.UpdateFromAppend(before.AoclLeafCount(), addition.canonical_commitment,
                                  before.AoclPeaks());
  SlideUpdate update;
  if (ComputeSlideUpdate(before, &update)) {
    ApplySlideUpdate(update, ComputeIndices(own_item), &target_chunks);
  }
}

void MsMembershipProof::UpdateFromRemove(const RemovalRecord& applied) {
  ApplyRemoveUpdate(applied, applied.ChunkMutations(), &target_chunks);
}

}  // namespace veil::mutator_set
