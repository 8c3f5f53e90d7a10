#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "consensus/validation.hpp"
#include "node/chain_view.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "util/sync.hpp"

namespace veil::node {

struct MempoolEntry {
  primitives::CTransaction tx;
  primitives::Hash256 txid{};
  std::uint64_t size_bytes{0};
  primitives::Amount fee{0};
  // fee * 1000 / size_bytes
  std::uint64_t feerate_q{0};
  std::uint64_t time_first_seen{0};
  // Insertion order; breaks feerate ties.
  std::uint64_t sequence{0};
};

struct MempoolOptions {
  std::uint64_t max_bytes{64ULL * 1024 * 1024};
  std::size_t max_count{50'000};
  // UNIX seconds; defaults to the system clock.
  std::function<std::uint64_t()> clock;
};

std::uint64_t ComputeFeerate(primitives::Amount fee, std::uint64_t size_bytes);

// Pending transactions, guarded by their own lock. Transaction proofs are
// expected to be verified by the caller. The removal records of every entry
// are current against one chain tip; Insert only admits against that tip.
// Lock order is mempool then chain; the chain never calls back in.
class Mempool {
 public:
  explicit Mempool(MempoolOptions options = {});

  // Admits `tx` when its inputs are removable at the tip the pool is synced
  // to. On a full pool the entries it displaces are chosen first; if `tx`
  // would itself be among them it is rejected and nothing is evicted.
  bool Insert(const primitives::CTransaction& tx, const ChainView& chain,
              consensus::ValidationState* state);

  // Drops transactions included in or conflicting with `block`. Given the
  // accumulator the block was applied to, the removal records of the
  // remaining entries are carried forward and entries that stop verifying
  // are dropped. Returns the number of entries removed.
  std::size_t RemoveConfirmed(
      const primitives::CBlock& block,
      const std::optional<mutator_set::MutatorSetAccumulator>& predecessor_accumulator);

  // Rebuilds the chunk proofs of every entry against the chain's tip, then
  // drops entries with an input that is not removable there. Used after a
  // reorganization and at startup.
  std::size_t Revalidate(const ChainView& chain);

  std::size_t EvictToCapacity();

  // Highest feerate first; equal feerates in insertion order.
  std::vector<MempoolEntry> Snapshot() const;

  bool Contains(const primitives::Hash256& txid) const;
  std::size_t Size() const;
  std::uint64_t Bytes() const;

 private:
  struct FeeIndexKey {
    std::uint64_t feerate_q{0};
    std::uint64_t sequence{0};
    primitives::Hash256 txid{};
  };

  // Eviction order: lowest feerate first, newest first among equals.
  struct FeeIndexLess {
    bool operator()(const FeeIndexKey& a, const FeeIndexKey& b) const noexcept {
      if (a.feerate_q != b.feerate_q) {
        return a.feerate_q < b.feerate_q;
      }
      return a.sequence > b.sequence;
    }
  };

  bool AdmitLocked(MempoolEntry entry, consensus::ValidationState* state);
  void RemoveLocked(const primitives::Hash256& txid);
  std::size_t EvictToCapacityLocked();
  bool OverCapacityLocked() const;
  void ClearLocked();

  MempoolOptions options_;
  mutable util::sync::RwLock lock_{"mempool"};
  std::unordered_map<primitives::Hash256, MempoolEntry, primitives::Hash256Hasher> entries_;
  // Index-set digest of every pending input -> spending txid.
  std::unordered_map<primitives::Hash256, primitives::Hash256, primitives::Hash256Hasher> spends_;
  std::set<FeeIndexKey, FeeIndexLess> fee_index_;
  std::uint64_t bytes_{0};
  std::uint64_t next_sequence_{0};
  // Tip the entries' removal records are valid against; unset until the
  // first block or revalidation.
  std::optional<primitives::Hash256> tip_hash_;
};

}  // namespace veil::node
