#include "consensus/mutator_set/shared.hpp"

#include <algorithm>
#include <set>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::mutator_set {

namespace {

primitives::Hash256 ToHash256(const crypto::Sha3_256Hash& hash) {
  primitives::Hash256 out{};
  std::copy(hash.begin(), hash.end(), out.begin());
  return out;
}

}  // namespace

primitives::Hash256 ReceiverDigest(const primitives::Hash256& receiver_preimage) {
  return ToHash256(crypto::TaggedSha3_256("veil/ms/receiver", {receiver_preimage}));
}

primitives::Hash256 ComputeCommitment(const primitives::Hash256& item,
                                      const primitives::Hash256& sender_randomness,
                                      const primitives::Hash256& receiver_digest) {
  return ToHash256(
      crypto::TaggedSha3_256("veil/ms/commit", {item, sender_randomness, receiver_digest}));
}

AbsoluteIndices GetSwbfIndices(const primitives::Hash256& item,
                               const primitives::Hash256& sender_randomness,
                               const primitives::Hash256& receiver_preimage,
                               std::uint64_t aocl_leaf_index) {
  std::vector<std::uint8_t> leaf_bytes;
  primitives::serialize::WriteUint64(&leaf_bytes, aocl_leaf_index);
  const std::uint64_t offset = BatchIndex(aocl_leaf_index) * kChunkSize;

  std::set<std::uint64_t> picked;
  std::vector<std::uint8_t> counter_bytes;
  for (std::uint64_t counter = 0; picked.size() < kNumTrials; ++counter) {
    counter_bytes.clear();
    primitives::serialize::WriteUint64(&counter_bytes, counter);
    const auto digest = crypto::TaggedSha3_256(
        "veil/ms/index",
        {item, leaf_bytes, sender_randomness, receiver_preimage, counter_bytes});
    std::uint64_t sample = 0;
    for (int i = 0; i < 8; ++i) {
      sample |= static_cast<std::uint64_t>(digest[static_cast<std::size_t>(i)]) << (8 * i);
    }
    picked.insert(offset + (sample % kWindowSize));
  }

  AbsoluteIndices out{};
  std::copy(picked.begin(), picked.end(), out.begin());
  return out;
}

}  // namespace veil::mutator_set
