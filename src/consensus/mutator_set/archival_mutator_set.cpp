#include "consensus/mutator_set/archival_mutator_set.hpp"

#include <set>
#include <string>
#include <utility>

namespace veil::mutator_set {

void ArchivalMutatorSet::Add(const AdditionRecord& record) {
  if (WindowSlides(aocl_.LeafCount())) {
    Chunk chunk = window_.Slide();
    swbf_inactive_.Append(chunk.Hash());
    chunks_.push_back(std::move(chunk));
  }
  aocl_.Append(record.canonical_commitment);
}

bool ArchivalMutatorSet::Remove(const RemovalRecord& record,
                                std::vector<std::uint64_t>* flipped_indices,
                                std::string* error) {
  std::string reason;
  if (!CanRemove(record, &reason)) {
    if (error) *error = "invalid removal: " + reason;
    return false;
  }
  const std::uint64_t window_start = WindowStart();
  std::vector<std::uint64_t> flipped;
  std::set<std::uint64_t> touched;
  for (auto index : record.absolute_indices) {
    bool newly_set = false;
    if (index >= window_start) {
      newly_set = window_.Insert(static_cast<std::uint32_t>(index - window_start));
    } else {
      const std::uint64_t chunk_index = index / kChunkSize;
      newly_set = chunks_[static_cast<std::size_t>(chunk_index)].Insert(
          static_cast<std::uint32_t>(index % kChunkSize));
      touched.insert(chunk_index);
    }
    if (newly_set) {
      flipped.push_back(index);
    }
  }
  for (auto chunk_index : touched) {
    swbf_inactive_.MutateLeaf(chunk_index, chunks_[static_cast<std::size_t>(chunk_index)].Hash());
  }
  if (flipped_indices) {
    *flipped_indices = std::move(flipped);
  }
  return true;
}

bool ArchivalMutatorSet::RevertAdd(const AdditionRecord& record, std::string* error) {
  const std::uint64_t count = aocl_.LeafCount();
  primitives::Hash256 last{};
  if (count == 0 || !aocl_.GetLeaf(count - 1, &last)) {
    if (error) *error = "revert add on empty commitment list";
    return false;
  }
  if (last != record.canonical_commitment) {
    if (error) *error = "revert add does not match last commitment";
    return false;
  }
  if (WindowSlides(count - 1)) {
    if (chunks_.empty()) {
      if (error) *error = "revert add expected a committed chunk";
      return false;
    }
    if (!window_.SlideBack(chunks_.back())) {
      if (error) *error = "revert add found bits in the window's top chunk";
      return false;
    }
    chunks_.pop_back();
    swbf_inactive_.RemoveLast(nullptr);
  }
  aocl_.RemoveLast(nullptr);
  return true;
}

bool ArchivalMutatorSet::RevertRemove(const std::vector<std::uint64_t>& flipped_indices,
                                      std::string* error) {
  const std::uint64_t window_start = WindowStart();
  for (auto index : flipped_indices) {
    bool set = false;
    if (index >= window_start) {
      set = index - window_start < kWindowSize &&
            window_.Contains(static_cast<std::uint32_t>(index - window_start));
    } else {
      const auto chunk_index = static_cast<std::size_t>(index / kChunkSize);
      set = chunk_index < chunks_.size() &&
            chunks_[chunk_index].Contains(static_cast<std::uint32_t>(index % kChunkSize));
    }
    if (!set) {
      if (error) *error = "revert remove of unset index " + std::to_string(index);
      return false;
    }
  }
  std::set<std::uint64_t> touched;
  for (auto index : flipped_indices) {
    if (index >= window_start) {
      window_.Remove(static_cast<std::uint32_t>(index - window_start));
    } else {
      const std::uint64_t chunk_index = index / kChunkSize;
      chunks_[static_cast<std::size_t>(chunk_index)].Erase(
          static_cast<std::uint32_t>(index % kChunkSize));
      touched.insert(chunk_index);
    }
  }
  for (auto chunk_index : touched) {
    swbf_inactive_.MutateLeaf(chunk_index, chunks_[static_cast<std::size_t>(chunk_index)].Hash());
  }
  return true;
}

bool ArchivalMutatorSet::RestoreMembershipProof(const primitives::Hash256& item,
                                                const primitives::Hash256& sender_randomness,
                                                const primitives::Hash256& receiver_preimage,
                                                std::uint64_t aocl_leaf_index,
                                                MsMembershipProof* proof,
                                                std::string* error) const {
  primitives::Hash256 leaf{};
  if (!aocl_.GetLeaf(aocl_leaf_index, &leaf)) {
    if (error) *error = "unknown commitment list index";
    return false;
  }
  const auto commitment =
      ComputeCommitment(item, sender_randomness, ReceiverDigest(receiver_preimage));
  if (leaf != commitment) {
    if (error) *error = "item does not match commitment at index";
    return false;
  }
  MsMembershipProof out;
  out.sender_randomness = sender_randomness;
  out.receiver_preimage = receiver_preimage;
  aocl_.Prove(aocl_leaf_index, &out.auth_path_aocl);
  if (!CollectTargetChunks(out.ComputeIndices(item), &out.target_chunks, error)) {
    return false;
  }
  if (proof) {
    *proof = std::move(out);
  }
  return true;
}

bool ArchivalMutatorSet::RefreshTargetChunks(RemovalRecord* record, std::string* error) const {
  if (!record) {
    if (error) *error = "missing removal record";
    return false;
  }
  ChunkDictionary chunks;
  if (!CollectTargetChunks(record->absolute_indices, &chunks, error)) {
    return false;
  }
  record->target_chunks = std::move(chunks);
  return true;
}

bool ArchivalMutatorSet::CollectTargetChunks(const AbsoluteIndices& indices,
                                             ChunkDictionary* out, std::string* error) const {
  const std::uint64_t window_start = WindowStart();
  ChunkDictionary chunks;
  for (auto index : indices) {
    if (index >= window_start) {
      continue;
    }
    const std::uint64_t chunk_index = index / kChunkSize;
    if (chunks.count(chunk_index) != 0) {
      continue;
    }
    ChunkEntry entry;
    if (chunk_index >= chunks_.size() || !swbf_inactive_.Prove(chunk_index, &entry.proof)) {
      if (error) *error = "no committed chunk " + std::to_string(chunk_index);
      return false;
    }
    entry.chunk = chunks_[static_cast<std::size_t>(chunk_index)];
    chunks.emplace(chunk_index, std::move(entry));
  }
  *out = std::move(chunks);
  return true;
}

bool ArchivalMutatorSet::FromParts(const std::vector<primitives::Hash256>& aocl_leaves,
                                   std::vector<Chunk> chunks, ActiveWindow window,
                                   ArchivalMutatorSet* out, std::string* error) {
  if (chunks.size() != SlidChunkCount(aocl_leaves.size())) {
    if (error) *error = "chunk count does not match commitment count";
    return false;
  }
  for (const auto& chunk : chunks) {
    for (auto index : chunk.relative_indices) {
      if (index >= kChunkSize) {
        if (error) *error = "chunk bit out of range";
        return false;
      }
    }
  }
  const auto& relative = window.RelativeIndices();
  if (!relative.empty() && relative.back() >= kWindowSize) {
    if (error) *error = "window bit out of range";
    return false;
  }
  ArchivalMutatorSet set;
  for (const auto& leaf : aocl_leaves) {
    set.aocl_.Append(leaf);
  }
  for (const auto& chunk : chunks) {
    set.swbf_inactive_.Append(chunk.Hash());
  }
  set.chunks_ = std::move(chunks);
  set.window_ = std::move(window);
  if (out) {
    *out = std::move(set);
  }
  return true;
}

}  // namespace veil::mutator_set
