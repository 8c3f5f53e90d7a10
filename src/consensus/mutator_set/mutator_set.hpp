#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "consensus/mutator_set/active_window.hpp"
#include "consensus/mutator_set/records.hpp"
#include "consensus/mutator_set/shared.hpp"
#include "primitives/hash.hpp"

namespace veil::mutator_set {

class MutatorSetAccumulator;

// Privacy-preserving accumulator over unspent outputs: an append-only
// commitment list (AOCL) plus a sliding-window bloom filter whose set bits
// mark spent items. Backends differ in how much of the structure they keep;
// the read-side rules below are shared so every backend agrees on validity
// and on the resulting root.
class MutatorSet {
 public:
  virtual ~MutatorSet() = default;

  virtual std::uint64_t AoclLeafCount() const = 0;
  virtual std::vector<primitives::Hash256> AoclPeaks() const = 0;
  virtual std::uint64_t SwbfInactiveLeafCount() const = 0;
  virtual std::vector<primitives::Hash256> SwbfInactivePeaks() const = 0;
  virtual const ActiveWindow& Window() const = 0;

  virtual void Add(const AdditionRecord& record) = 0;
  // Sets every index of `record`. Fails without mutating when CanRemove() is
  // false. `flipped_indices` receives the indices that went from unset to set.
  virtual bool Remove(const RemovalRecord& record, std::vector<std::uint64_t>* flipped_indices,
                      std::string* error) = 0;

  std::uint64_t WindowStart() const { return SlidChunkCount(AoclLeafCount()) * kChunkSize; }

  bool CanRemove(const RemovalRecord& record, std::string* reason = nullptr) const;
  // Membership proof for an item that is about to be added with Add().
  MsMembershipProof Prove(const primitives::Hash256& item,
                          const primitives::Hash256& sender_randomness,
                          const primitives::Hash256& receiver_preimage) const;
  bool Verify(const primitives::Hash256& item, const MsMembershipProof& proof) const;
  RemovalRecord Drop(const primitives::Hash256& item, const MsMembershipProof& proof) const;

  primitives::Hash256 Hash() const;
  MutatorSetAccumulator Snapshot() const;

 protected:
  // Validates the chunk proofs of `chunks` against the inactive MMR for every
  // index below the window start and reports whether any index is unset.
  bool CheckIndices(const AbsoluteIndices& indices, const ChunkDictionary& chunks,
                    bool* any_unset, std::string* reason) const;
};

}  // namespace veil::mutator_set
