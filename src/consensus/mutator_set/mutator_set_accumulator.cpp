#include "consensus/mutator_set/mutator_set_accumulator.hpp"

namespace veil::mutator_set {

MutatorSetAccumulator::MutatorSetAccumulator(MmrAccumulator aocl, MmrAccumulator swbf_inactive,
                                             ActiveWindow window)
    : aocl_(std::move(aocl)),
      swbf_inactive_(std::move(swbf_inactive)),
      window_(std::move(window)) {}

void MutatorSetAccumulator::Add(const AdditionRecord& record) {
  if (WindowSlides(aocl_.LeafCount())) {
    const Chunk chunk = window_.Slide();
    swbf_inactive_.Append(chunk.Hash());
  }
  aocl_.Append(record.canonical_commitment);
}

bool MutatorSetAccumulator::Remove(const RemovalRecord& record,
                                   std::vector<std::uint64_t>* flipped_indices,
                                   std::string* error) {
  std::string reason;
  if (!CanRemove(record, &reason)) {
    if (error) *error = "invalid removal: " + reason;
    return false;
  }
  MmrAccumulator inactive = swbf_inactive_;
  for (const auto& mutation : record.ChunkMutations()) {
    if (!inactive.MutateLeaf(mutation.proof, mutation.new_leaf)) {
      if (error) *error = "chunk mutation failed";
      return false;
    }
  }
  const std::uint64_t window_start = WindowStart();
  std::vector<std::uint64_t> flipped;
  for (auto index : record.absolute_indices) {
    if (index >= window_start) {
      if (window_.Insert(static_cast<std::uint32_t>(index - window_start))) {
        flipped.push_back(index);
      }
      continue;
    }
    const auto& entry = record.target_chunks.at(index / kChunkSize);
    if (!entry.chunk.Contains(static_cast<std::uint32_t>(index % kChunkSize))) {
      flipped.push_back(index);
    }
  }
  swbf_inactive_ = std::move(inactive);
  if (flipped_indices) {
    *flipped_indices = std::move(flipped);
  }
  return true;
}

}  // namespace veil::mutator_set
