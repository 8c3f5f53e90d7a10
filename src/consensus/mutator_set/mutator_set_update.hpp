#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "consensus/mutator_set/mutator_set.hpp"
#include "consensus/mutator_set/records.hpp"

namespace veil::mutator_set {

// What applying one block did to the set; enough to undo it given the
// block's addition records.
struct MutatorSetDelta {
  std::uint64_t additions{0};
  std::vector<std::uint64_t> flipped_indices;

  bool operator==(const MutatorSetDelta& other) const = default;
};

// All addition and removal records of one block, in block order. Removal
// records are valid against the state before the block.
struct MutatorSetUpdate {
  std::vector<AdditionRecord> additions;
  std::vector<RemovalRecord> removals;

  // Adds every addition, then removes every removal, refreshing pending
  // records as the set moves. `preserved` records (e.g. mempool inputs) are
  // refreshed alongside so they stay valid against the resulting state.
  // On failure `set` may be partially updated; callers apply to a copy.
  bool Apply(MutatorSet* set, MutatorSetDelta* delta, std::string* error,
             const std::vector<RemovalRecord*>& preserved = {}) const;
};

}  // namespace veil::mutator_set
