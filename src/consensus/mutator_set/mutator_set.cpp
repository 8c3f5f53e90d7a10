#include "consensus/mutator_set/mutator_set.hpp"

#include <algorithm>
#include <set>

#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "crypto/hash.hpp"

namespace veil::mutator_set {

namespace {

void SetReason(std::string* reason, const char* text) {
  if (reason) {
    *reason = text;
  }
}

}  // namespace

bool MutatorSet::CheckIndices(const AbsoluteIndices& indices, const ChunkDictionary& chunks,
                              bool* any_unset, std::string* reason) const {
  const std::uint64_t window_start = WindowStart();
  const std::uint64_t inactive_count = SwbfInactiveLeafCount();
  const auto inactive_peaks = SwbfInactivePeaks();
  const auto& window = Window();

  std::set<std::uint64_t> referenced;
  bool unset = false;
  for (auto index : indices) {
    if (index >= window_start + kWindowSize) {
      SetReason(reason, "index beyond active window");
      return false;
    }
    if (index >= window_start) {
      if (!window.Contains(static_cast<std::uint32_t>(index - window_start))) {
        unset = true;
      }
      continue;
    }
    const std::uint64_t chunk_index = index / kChunkSize;
    auto it = chunks.find(chunk_index);
    if (it == chunks.end()) {
      SetReason(reason, "missing target chunk");
      return false;
    }
    if (referenced.insert(chunk_index).second) {
      if (it->second.proof.leaf_index != chunk_index ||
          !it->second.proof.Verify(it->second.chunk.Hash(), inactive_peaks, inactive_count)) {
        SetReason(reason, "target chunk proof does not verify");
        return false;
      }
    }
    if (!it->second.chunk.Contains(static_cast<std::uint32_t>(index % kChunkSize))) {
      unset = true;
    }
  }
  if (referenced.size() != chunks.size()) {
    SetReason(reason, "unreferenced target chunk");
    return false;
  }
  if (any_unset) {
    *any_unset = unset;
  }
  return true;
}

bool MutatorSet::CanRemove(const RemovalRecord& record, std::string* reason) const {
  if (!record.HasWellFormedIndices()) {
    SetReason(reason, "indices not strictly ascending");
    return false;
  }
  bool any_unset = false;
  if (!CheckIndices(record.absolute_indices, record.target_chunks, &any_unset, reason)) {
    return false;
  }
  if (!any_unset) {
    SetReason(reason, "already removed");
    return false;
  }
  return true;
}

MsMembershipProof MutatorSet::Prove(const primitives::Hash256& item,
                                    const primitives::Hash256& sender_randomness,
                                    const primitives::Hash256& receiver_preimage) const {
  MsMembershipProof proof;
  proof.sender_randomness = sender_randomness;
  proof.receiver_preimage = receiver_preimage;
  const auto commitment =
      ComputeCommitment(item, sender_randomness, ReceiverDigest(receiver_preimage));
  MmrAccumulator aocl(AoclPeaks(), AoclLeafCount());
  proof.auth_path_aocl = aocl.Append(commitment);
  return proof;
}

bool MutatorSet::Verify(const primitives::Hash256& item, const MsMembershipProof& proof) const {
  const auto commitment = ComputeCommitment(item, proof.sender_randomness,
                                            ReceiverDigest(proof.receiver_preimage));
  if (!proof.auth_path_aocl.Verify(commitment, AoclPeaks(), AoclLeafCount())) {
    return false;
  }
  bool any_unset = false;
  if (!CheckIndices(proof.ComputeIndices(item), proof.target_chunks, &any_unset, nullptr)) {
    return false;
  }
  return any_unset;
}

RemovalRecord MutatorSet::Drop(const primitives::Hash256& item,
                               const MsMembershipProof& proof) const {
  RemovalRecord record;
  record.absolute_indices = proof.ComputeIndices(item);
  record.target_chunks = proof.target_chunks;
  return record;
}

primitives::Hash256 MutatorSet::Hash() const {
  const auto aocl = BagPeaks(AoclPeaks(), AoclLeafCount());
  const auto inactive = BagPeaks(SwbfInactivePeaks(), SwbfInactiveLeafCount());
  const auto window = Window().Hash();
  const auto digest = crypto::TaggedSha3_256("veil/ms/root", {aocl, inactive, window});
  primitives::Hash256 out{};
  std::copy(digest.begin(), digest.end(), out.begin());
  return out;
}

MutatorSetAccumulator MutatorSet::Snapshot() const {
  return MutatorSetAccumulator(MmrAccumulator(AoclPeaks(), AoclLeafCount()),
                               MmrAccumulator(SwbfInactivePeaks(), SwbfInactiveLeafCount()),
                               Window());
}

}  // namespace veil::mutator_set
