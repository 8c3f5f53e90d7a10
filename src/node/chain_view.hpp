#pragma once

#include <cstdint>
#include <vector>

#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "consensus/mutator_set/records.hpp"
#include "primitives/hash.hpp"

namespace veil::node {

// Tip hash and accumulator read under one acquisition of the chain lock.
struct TipState {
  primitives::Hash256 hash{};
  std::uint64_t height{0};
  mutator_set::MutatorSetAccumulator accumulator;
};

// Read-only window on the canonical chain. Components outside the chain
// state (the mempool) depend on this instead of the manager itself.
class ChainView {
 public:
  virtual ~ChainView() = default;

  virtual primitives::Hash256 TipHash() const = 0;
  virtual std::uint64_t TipHeight() const = 0;
  // Copy of the accumulator as of the current tip.
  virtual mutator_set::MutatorSetAccumulator TipAccumulator() const = 0;
  virtual TipState CurrentTip() const = 0;

  // Rebuilds the inactive-chunk proofs of `records` against the current tip
  // and returns that tip. Records that cannot be refreshed are left as they
  // are and fail removability against the returned accumulator.
  virtual TipState RefreshRemovalRecords(
      const std::vector<mutator_set::RemovalRecord*>& records) const = 0;
};

}  // namespace veil::node
