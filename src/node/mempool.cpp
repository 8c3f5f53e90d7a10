#include "node/mempool.hpp"

#include <algorithm>
#include <chrono>
#include <span>
#include <thread>
#include <unordered_set>
#include <utility>

#include "consensus/block_hash.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/tx_validator.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace veil::node {

namespace {

// Admission waits up to about 50ms for the pool to catch up with the chain.
constexpr int kMaxTipAttempts = 10;

std::string HashToHex(const primitives::Hash256& hash) {
  return util::HexEncode(std::span<const std::uint8_t>(hash.data(), hash.size()));
}

bool AllInputsRemovable(const primitives::CTransaction& tx, const mutator_set::MutatorSet& set) {
  for (const auto& input : tx.kernel.inputs) {
    if (!set.CanRemove(input)) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::uint64_t ComputeFeerate(primitives::Amount fee, std::uint64_t size_bytes) {
  if (size_bytes == 0) {
    return 0;
  }
  return fee * 1000 / size_bytes;
}

Mempool::Mempool(MempoolOptions options) : options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = [] {
      return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                            std::chrono::system_clock::now().time_since_epoch())
                                            .count());
    };
  }
}

bool Mempool::Insert(const primitives::CTransaction& tx, const ChainView& chain,
                     consensus::ValidationState* state) {
  if (tx.IsCoinbase()) {
    return consensus::Reject(state, consensus::RejectReason::kMalformed,
                             "coinbase transaction outside a block");
  }
  if (!consensus::CheckTransactionStateless(tx, state)) {
    return false;
  }
  MempoolEntry entry;
  entry.tx = tx;
  entry.txid = primitives::ComputeTxId(tx);
  entry.size_bytes = primitives::serialize::SerializedTransactionSize(tx);
  entry.fee = tx.kernel.fee;
  entry.feerate_q = ComputeFeerate(tx.kernel.fee, entry.size_bytes);
  if (entry.size_bytes > options_.max_bytes || options_.max_count == 0) {
    return consensus::Reject(state, consensus::RejectReason::kFeeTooLow,
                             "transaction larger than the mempool");
  }

  for (int attempt = 1;; ++attempt) {
    // Read the chain before taking our own lock.
    const TipState tip = chain.CurrentTip();
    std::string removal_error;
    for (const auto& input : tx.kernel.inputs) {
      if (!tip.accumulator.CanRemove(input, &removal_error)) {
        return consensus::Reject(state, consensus::RejectReason::kInvalidRemoval, removal_error);
      }
    }
    auto guard = lock_.Write();
    if (!tip_hash_ || *tip_hash_ == tip.hash) {
      tip_hash_ = tip.hash;
      return AdmitLocked(std::move(entry), state);
    }
    // A block landed and the pool has not caught up with it yet.
    if (attempt == kMaxTipAttempts) {
      return consensus::Reject(state, consensus::RejectReason::kConflict,
                               "chain tip moved during admission");
    }
    guard.Unlock();
    std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
  }
}

bool Mempool::AdmitLocked(MempoolEntry entry, consensus::ValidationState* state) {
  const auto txid = entry.txid;
  const std::uint64_t feerate_q = entry.feerate_q;
  if (entries_.count(txid) != 0) {
    return consensus::Reject(state, consensus::RejectReason::kAlreadyKnown,
                             "transaction already in mempool");
  }

  std::vector<primitives::Hash256> conflicts;
  for (const auto& input : entry.tx.kernel.inputs) {
    const auto it = spends_.find(input.IndexSetDigest());
    if (it != spends_.end()) {
      conflicts.push_back(it->second);
    }
  }
  std::sort(conflicts.begin(), conflicts.end());
  conflicts.erase(std::unique(conflicts.begin(), conflicts.end()), conflicts.end());
  std::uint64_t conflict_bytes = 0;
  for (const auto& conflict : conflicts) {
    const auto& existing = entries_.at(conflict);
    if (feerate_q <= existing.feerate_q) {
      return consensus::Reject(state, consensus::RejectReason::kConflict,
                               "conflicts with " + HashToHex(conflict) + " at feerate " +
                                   std::to_string(existing.feerate_q));
    }
    conflict_bytes += existing.size_bytes;
  }

  // Pick the displaced entries before touching the pool. The new entry is
  // the newest, so it goes first among equal feerates.
  std::size_t count_after = entries_.size() - conflicts.size() + 1;
  std::uint64_t bytes_after = bytes_ - conflict_bytes + entry.size_bytes;
  const std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> replaced(
      conflicts.begin(), conflicts.end());
  std::vector<primitives::Hash256> evicted;
  for (const auto& key : fee_index_) {
    if (count_after <= options_.max_count && bytes_after <= options_.max_bytes) {
      break;
    }
    if (replaced.count(key.txid) != 0) {
      continue;
    }
    if (feerate_q <= key.feerate_q) {
      return consensus::Reject(state, consensus::RejectReason::kFeeTooLow,
                               "mempool full, minimum feerate " + std::to_string(key.feerate_q));
    }
    evicted.push_back(key.txid);
    --count_after;
    bytes_after -= entries_.at(key.txid).size_bytes;
  }
  if (count_after > options_.max_count || bytes_after > options_.max_bytes) {
    return consensus::Reject(state, consensus::RejectReason::kFeeTooLow,
                             "mempool full");
  }

  for (const auto& conflict : conflicts) {
    util::LogDebug("mempool", "replacing " + HashToHex(conflict) + " with " + HashToHex(txid));
    RemoveLocked(conflict);
  }
  for (const auto& victim : evicted) {
    util::LogDebug("mempool", "evicting " + HashToHex(victim) + " for " + HashToHex(txid));
    RemoveLocked(victim);
  }

  entry.time_first_seen = options_.clock();
  entry.sequence = next_sequence_++;
  for (const auto& input : entry.tx.kernel.inputs) {
    spends_[input.IndexSetDigest()] = txid;
  }
  fee_index_.insert(FeeIndexKey{feerate_q, entry.sequence, txid});
  bytes_ += entry.size_bytes;
  util::LogDebug("mempool", "accepted " + HashToHex(txid) + " feerate_q=" +
                                std::to_string(feerate_q) + " bytes=" +
                                std::to_string(entry.size_bytes));
  entries_.emplace(txid, std::move(entry));
  return true;
}

std::size_t Mempool::RemoveConfirmed(
    const primitives::CBlock& block,
    const std::optional<mutator_set::MutatorSetAccumulator>& predecessor_accumulator) {
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> confirmed;
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> spent;
  for (const auto& tx : block.transactions) {
    confirmed.insert(primitives::ComputeTxId(tx));
    for (const auto& input : tx.kernel.inputs) {
      spent.insert(input.IndexSetDigest());
    }
  }

  auto guard = lock_.Write();
  // Without the predecessor the records cannot be carried forward; the
  // caller revalidates against the chain afterwards.
  if (predecessor_accumulator) {
    tip_hash_ = consensus::ComputeBlockHash(block.header);
  } else {
    tip_hash_.reset();
  }
  std::vector<primitives::Hash256> doomed;
  for (const auto& [txid, entry] : entries_) {
    bool drop = confirmed.count(txid) != 0;
    for (const auto& input : entry.tx.kernel.inputs) {
      if (drop) break;
      drop = spent.count(input.IndexSetDigest()) != 0;
    }
    if (drop) {
      doomed.push_back(txid);
    }
  }
  for (const auto& txid : doomed) {
    RemoveLocked(txid);
  }
  std::size_t removed = doomed.size();

  if (predecessor_accumulator && !entries_.empty()) {
    // Carry the remaining removal records across the block.
    mutator_set::MutatorSetAccumulator working = *predecessor_accumulator;
    std::vector<mutator_set::RemovalRecord*> preserved;
    for (auto& [txid, entry] : entries_) {
      for (auto& input : entry.tx.kernel.inputs) {
        preserved.push_back(&input);
      }
    }
    mutator_set::MutatorSetDelta delta;
    std::string error;
    if (!consensus::BlockMutatorSetUpdate(block).Apply(&working, &delta, &error, preserved)) {
      util::LogWarn("mempool", "could not carry pending inputs across block: " + error +
                                   "; dropping all entries");
      removed += entries_.size();
      ClearLocked();
      return removed;
    }
    doomed.clear();
    for (const auto& [txid, entry] : entries_) {
      if (!AllInputsRemovable(entry.tx, working)) {
        doomed.push_back(txid);
      }
    }
    for (const auto& txid : doomed) {
      RemoveLocked(txid);
    }
    removed += doomed.size();
  }
  if (removed != 0) {
    util::LogDebug("mempool", "removed " + std::to_string(removed) +
                                  " entries after block at height " +
                                  std::to_string(block.header.height));
  }
  return removed;
}

std::size_t Mempool::Revalidate(const ChainView& chain) {
  auto guard = lock_.Write();
  std::vector<mutator_set::RemovalRecord*> records;
  for (auto& [txid, entry] : entries_) {
    for (auto& input : entry.tx.kernel.inputs) {
      records.push_back(&input);
    }
  }
  const TipState tip = chain.RefreshRemovalRecords(records);
  tip_hash_ = tip.hash;
  std::vector<primitives::Hash256> doomed;
  for (const auto& [txid, entry] : entries_) {
    if (!AllInputsRemovable(entry.tx, tip.accumulator)) {
      doomed.push_back(txid);
    }
  }
  for (const auto& txid : doomed) {
    RemoveLocked(txid);
  }
  if (!doomed.empty()) {
    util::LogInfo("mempool", "revalidation dropped " + std::to_string(doomed.size()) +
                                 " entries at height " + std::to_string(tip.height));
  }
  return doomed.size();
}

std::size_t Mempool::EvictToCapacity() {
  auto guard = lock_.Write();
  return EvictToCapacityLocked();
}

std::size_t Mempool::EvictToCapacityLocked() {
  std::size_t evicted = 0;
  while (OverCapacityLocked() && !fee_index_.empty()) {
    const auto victim = *fee_index_.begin();
    util::LogDebug("mempool", "evicting " + HashToHex(victim.txid) + " feerate_q=" +
                                  std::to_string(victim.feerate_q));
    RemoveLocked(victim.txid);
    ++evicted;
  }
  return evicted;
}

void Mempool::ClearLocked() {
  entries_.clear();
  spends_.clear();
  fee_index_.clear();
  bytes_ = 0;
}

bool Mempool::OverCapacityLocked() const {
  return entries_.size() > options_.max_count || bytes_ > options_.max_bytes;
}

void Mempool::RemoveLocked(const primitives::Hash256& txid) {
  const auto it = entries_.find(txid);
  if (it == entries_.end()) {
    return;
  }
  const auto& entry = it->second;
  for (const auto& input : entry.tx.kernel.inputs) {
    const auto sit = spends_.find(input.IndexSetDigest());
    if (sit != spends_.end() && sit->second == txid) {
      spends_.erase(sit);
    }
  }
  fee_index_.erase(FeeIndexKey{entry.feerate_q, entry.sequence, txid});
  bytes_ -= std::min(bytes_, entry.size_bytes);
  entries_.erase(it);
}

std::vector<MempoolEntry> Mempool::Snapshot() const {
  auto guard = lock_.Read();
  std::vector<MempoolEntry> snapshot;
  snapshot.reserve(entries_.size());
  for (const auto& [txid, entry] : entries_) {
    snapshot.push_back(entry);
  }
  std::sort(snapshot.begin(), snapshot.end(), [](const MempoolEntry& a, const MempoolEntry& b) {
    if (a.feerate_q != b.feerate_q) {
      return a.feerate_q > b.feerate_q;
    }
    return a.sequence < b.sequence;
  });
  return snapshot;
}

bool Mempool::Contains(const primitives::Hash256& txid) const {
  auto guard = lock_.Read();
  return entries_.count(txid) != 0;
}

std::size_t Mempool::Size() const {
  auto guard = lock_.Read();
  return entries_.size();
}

std::uint64_t Mempool::Bytes() const {
  auto guard = lock_.Read();
  return bytes_;
}

}  // namespace veil::node
