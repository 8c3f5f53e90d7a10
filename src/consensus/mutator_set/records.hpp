#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "consensus/mutator_set/chunk.hpp"
#include "consensus/mutator_set/mmr.hpp"
#include "consensus/mutator_set/shared.hpp"
#include "primitives/hash.hpp"

namespace veil::mutator_set {

class MutatorSet;

struct AdditionRecord {
  primitives::Hash256 canonical_commitment{};

  bool operator==(const AdditionRecord& other) const = default;
};

struct ChunkEntry {
  MmrMembershipProof proof;
  Chunk chunk;

  bool operator==(const ChunkEntry& other) const = default;
};

// Chunks of the inactive filter touched by a removal, each with its
// membership proof in the inactive MMR. Keyed by chunk index.
using ChunkDictionary = std::map<std::uint64_t, ChunkEntry>;

// One step of a multi-leaf chunk mutation: the proof is valid for the MMR
// state right before `new_leaf` is written.
struct ChunkMutation {
  MmrMembershipProof proof;
  primitives::Hash256 new_leaf{};
};

struct RemovalRecord {
  AbsoluteIndices absolute_indices{};
  ChunkDictionary target_chunks;

  bool operator==(const RemovalRecord& other) const = default;

  // Identifies the spent output across record refreshes; two records with the
  // same digest spend the same output.
  primitives::Hash256 IndexSetDigest() const;
  bool HasWellFormedIndices() const;

  // The ordered chunk-leaf writes that applying this record performs.
  std::vector<ChunkMutation> ChunkMutations() const;

  // Refreshes `records` for the addition about to be applied to `before`.
  static void BatchUpdateFromAddition(const std::vector<RemovalRecord*>& records,
                                      const MutatorSet& before);
  // Refreshes `records` after `applied` was removed.
  static void BatchUpdateFromRemove(const std::vector<RemovalRecord*>& records,
                                    const RemovalRecord& applied);
};

// Everything the owner of an output needs to prove it is unspent and to
// build its removal record later.
struct MsMembershipProof {
  primitives::Hash256 sender_randomness{};
  primitives::Hash256 receiver_preimage{};
  MmrMembershipProof auth_path_aocl;
  ChunkDictionary target_chunks;

  bool operator==(const MsMembershipProof& other) const = default;

  AbsoluteIndices ComputeIndices(const primitives::Hash256& item) const;
  void UpdateFromAddition(const primitives::Hash256& own_item, const MutatorSet& before,
                          const AdditionRecord& addition);
  void UpdateFromRemove(const RemovalRecord& applied);
};

}  // namespace veil::mutator_set
