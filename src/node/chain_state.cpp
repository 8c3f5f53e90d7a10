#include "node/chain_state.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>
#include <utility>

#include "config/network.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/pow.hpp"
#include "storage/mutator_set_snapshot.hpp"
#include "util/log.hpp"

namespace veil::node {

namespace {

std::string ShortHash(const primitives::Hash256& hash) {
  return consensus::BlockHashHex(hash, 16);
}

std::uint64_t SystemClockSeconds() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

}  // namespace

ChainState::ChainState(const consensus::ChainParams& params, ChainStateOptions options)
    : params_(params), options_(std::move(options)) {
  snapshot_path_ = options_.data_dir / "mutator_set.dat";
  if (!options_.clock) {
    options_.clock = &SystemClockSeconds;
  }
}

bool ChainState::Initialize(std::string* error) {
  auto guard = lock_.Write();
  const auto& network = config::GetNetworkConfig(params_.network);
  archive_ = storage::ArchivalIndex::Open(options_.data_dir, network.storage_magic, error);
  if (!archive_) {
    return false;
  }
  block_index_.clear();
  active_chain_.clear();
  side_blocks_.clear();
  side_block_fifo_.clear();
  telemetry_ = ChainTelemetry{};

  if (archive_->Empty()) {
    mutator_set::ArchivalMutatorSet genesis_set;
    mutator_set::MutatorSetDelta delta;
    std::string apply_error;
    if (!consensus::BlockMutatorSetUpdate(params_.genesis_block)
             .Apply(&genesis_set, &delta, &apply_error)) {
      if (error) *error = "failed to apply genesis block: " + apply_error;
      return false;
    }
    if (!archive_->AppendBlock(params_.genesis_block, delta, error)) {
      return false;
    }
    util::LogInfo("chain", "wrote genesis block " + ShortHash(params_.genesis_hash));
  }

  primitives::Hash256 genesis_hash{};
  if (!archive_->GetBlockHash(0, &genesis_hash) || genesis_hash != params_.genesis_hash) {
    if (error) *error = "archive does not contain the expected genesis block for this network";
    return false;
  }
  for (std::uint64_t height = 0; height < archive_->BlockCount(); ++height) {
    primitives::CBlockHeader header;
    primitives::Hash256 hash{};
    archive_->GetHeader(height, &header);
    archive_->GetBlockHash(height, &hash);
    BlockRecord* record = AddRecordLocked(header, hash);
    if (!record || record->height != height) {
      if (error) *error = "archived block " + std::to_string(height) + " does not extend the chain";
      return false;
    }
    record->in_active_chain = true;
    record->connected_once = true;
    active_chain_.push_back(record);
  }

  const BlockRecord* tip = active_chain_.back();
  mutator_set::ArchivalMutatorSet loaded;
  storage::SnapshotTip snapshot_tip;
  std::string snapshot_error;
  if (storage::LoadMutatorSetSnapshot(snapshot_path_, &loaded, &snapshot_tip, &snapshot_error) &&
      snapshot_tip.block_hash == tip->hash && snapshot_tip.height == tip->height &&
      loaded.Hash() == tip->header.mutator_set_root) {
    mutator_set_ = std::move(loaded);
  } else {
    if (snapshot_error.empty()) {
      snapshot_error = "snapshot does not match the archived tip";
    }
    util::LogInfo("chain", "rebuilding mutator set from archive (" + snapshot_error + ")");
    if (!RebuildMutatorSetLocked(error)) {
      return false;
    }
    SaveSnapshotLocked();
  }
  util::LogInfo("chain", "loaded chain at height " + std::to_string(tip->height) + " tip " +
                             ShortHash(tip->hash));
  return true;
}

bool ChainState::RebuildMutatorSetLocked(std::string* error) {
  mutator_set::ArchivalMutatorSet rebuilt;
  std::string replay_error;
  const bool read_ok = archive_->ForEach(
      0, active_chain_.back()->height,
      [&](std::uint64_t height, const primitives::CBlock& block,
          const mutator_set::MutatorSetDelta& stored) {
        mutator_set::MutatorSetDelta delta;
        std::string apply_error;
        if (!consensus::BlockMutatorSetUpdate(block).Apply(&rebuilt, &delta, &apply_error)) {
          replay_error = "replay of block " + std::to_string(height) + " failed: " + apply_error;
          return false;
        }
        if (rebuilt.Hash() != block.header.mutator_set_root || delta != stored) {
          replay_error = "replay of block " + std::to_string(height) + " diverged from archive";
          return false;
        }
        return true;
      },
      error);
  if (!read_ok) {
    return false;
  }
  if (!replay_error.empty()) {
    if (error) *error = replay_error;
    return false;
  }
  mutator_set_ = std::move(rebuilt);
  return true;
}

void ChainState::SaveSnapshotLocked() {
  const BlockRecord* tip = active_chain_.back();
  std::string error;
  if (!storage::SaveMutatorSetSnapshot(snapshot_path_, mutator_set_, {tip->hash, tip->height},
                                       &error)) {
    ++telemetry_.snapshot_failures;
    telemetry_.snapshot_dirty = true;
    util::LogWarn("chain", "failed to update mutator set snapshot; restart will replay the archive: " +
                               error);
    return;
  }
  telemetry_.snapshot_dirty = false;
}

bool ChainState::ProcessBlock(const primitives::CBlock& block,
                              const crypto::ProofVerifier& verifier,
                              consensus::ValidationState* state, ChainUpdate* update) {
  consensus::ValidationState local_state;
  if (!state) {
    state = &local_state;
  }
  ChainUpdate local_update;
  if (!update) {
    update = &local_update;
  }
  *update = ChainUpdate{};
  const auto hash = consensus::ComputeBlockHash(block.header);

  ContextSnapshot context;
  {
    auto guard = lock_.Read();
    if (!PrepareContextLocked(block, hash, &context, state)) {
      return false;
    }
  }

  // Everything below until the write lock needs no chain state.
  if (!consensus::CheckBlockHeader(block, context.header, params_, state) ||
      !consensus::CheckProofOfWork(block.header, params_, state) ||
      !consensus::CheckBlockBody(block, params_, verifier, state)) {
    util::LogDebug("chain", "rejected block " + ShortHash(hash) + ": " + state->ToString());
    return false;
  }
  std::optional<mutator_set::MutatorSetAccumulator> connected_accumulator;
  mutator_set::MutatorSetDelta delta;
  if (context.tip_accumulator) {
    mutator_set::MutatorSetAccumulator working = *context.tip_accumulator;
    if (!consensus::ConnectBlockToAccumulator(block, &working, &delta, state)) {
      util::LogDebug("chain", "rejected block " + ShortHash(hash) + ": " + state->ToString());
      return false;
    }
    connected_accumulator = std::move(working);
  }

  std::vector<BlockNotification> notifications;
  bool ok = false;
  {
    auto guard = lock_.Write();
    if (telemetry_.corrupt) {
      return consensus::Reject(state, consensus::RejectReason::kCorruptState,
                               "chain state is corrupt; restart required");
    }
    if (block_index_.count(hash) != 0) {
      return consensus::Reject(state, consensus::RejectReason::kAlreadyKnown,
                               "block already known");
    }
    BlockRecord* record = AddRecordLocked(block.header, hash);
    if (!record) {
      return consensus::Reject(state, consensus::RejectReason::kUnknownPredecessor,
                               "unknown predecessor");
    }
    if (connected_accumulator && active_chain_.back()->hash == context.tip_hash) {
      ok = ConnectTipLocked(record, block, delta, state, &notifications);
      if (ok) {
        update->tip_changed = true;
        update->connected.push_back(block);
        update->predecessor_accumulator = std::move(context.tip_accumulator);
      } else if (!telemetry_.corrupt) {
        block_index_.erase(hash);
      }
    } else if (!IsBetterThanTipLocked(record)) {
      CacheSideBlockLocked(hash, block);
      util::LogInfo("chain", "stored side-branch block " + ShortHash(hash) + " at height " +
                                 std::to_string(record->height));
      ok = true;
    } else {
      ok = ReorganizeLocked(record, block, state, update, &notifications);
    }
  }
  Notify(notifications);
  return ok;
}

bool ChainState::PrepareContextLocked(const primitives::CBlock& block,
                                      const primitives::Hash256& hash, ContextSnapshot* context,
                                      consensus::ValidationState* state) const {
  if (telemetry_.corrupt) {
    return consensus::Reject(state, consensus::RejectReason::kCorruptState,
                             "chain state is corrupt; restart required");
  }
  const auto known = block_index_.find(hash);
  if (known != block_index_.end()) {
    return consensus::Reject(state, consensus::RejectReason::kAlreadyKnown,
                             known->second->failed ? "block previously rejected"
                                                   : "block already known");
  }
  const auto parent_it = block_index_.find(block.header.previous_block_hash);
  if (parent_it == block_index_.end()) {
    orphan_blocks_.fetch_add(1, std::memory_order_relaxed);
    return consensus::Reject(state, consensus::RejectReason::kUnknownPredecessor,
                             "unknown predecessor " + ShortHash(block.header.previous_block_hash));
  }
  const BlockRecord* parent = parent_it->second.get();
  if (parent->failed) {
    return consensus::Reject(state, consensus::RejectReason::kUnknownPredecessor,
                             "predecessor failed validation");
  }
  context->header = HeaderContextLocked(parent);
  const BlockRecord* tip = active_chain_.back();
  context->tip_hash = tip->hash;
  context->parent_is_tip = parent == tip;
  if (context->parent_is_tip) {
    context->tip_accumulator = mutator_set_.Snapshot();
  }
  return true;
}

consensus::HeaderContext ChainState::HeaderContextLocked(const BlockRecord* parent) const {
  consensus::HeaderContext context;
  context.predecessor = parent->header;
  context.predecessor_work = parent->chain_work;
  std::vector<std::uint64_t> timestamps;
  const BlockRecord* cursor = parent;
  for (std::uint32_t i = 0; i < params_.median_time_span && cursor; ++i) {
    timestamps.push_back(cursor->header.timestamp);
    cursor = cursor->parent;
  }
  context.median_time_past = consensus::MedianTimePast(std::move(timestamps));
  const std::uint64_t height = parent->height + 1;
  std::uint64_t interval_first_timestamp = parent->header.timestamp;
  if (consensus::IsRetargetHeight(params_, height)) {
    if (const auto* first =
            AncestorLocked(parent, height - params_.difficulty_adjustment_interval)) {
      interval_first_timestamp = first->header.timestamp;
    }
  }
  context.expected_bits =
      consensus::NextWorkRequired(params_, height, parent->header, interval_first_timestamp);
  context.now = Now();
  return context;
}

const BlockRecord* ChainState::AncestorLocked(const BlockRecord* from,
                                              std::uint64_t height) const {
  if (!from || height > from->height) {
    return nullptr;
  }
  const BlockRecord* cursor = from;
  while (cursor && cursor->height > height) {
    if (cursor->in_active_chain) {
      return active_chain_[height];
    }
    cursor = cursor->parent;
  }
  return cursor;
}

BlockRecord* ChainState::AddRecordLocked(const primitives::CBlockHeader& header,
                                         const primitives::Hash256& hash) {
  BlockRecord* parent = nullptr;
  if (header.height != 0) {
    const auto parent_it = block_index_.find(header.previous_block_hash);
    if (parent_it == block_index_.end()) {
      return nullptr;
    }
    parent = parent_it->second.get();
  }
  auto record = std::make_unique<BlockRecord>();
  record->header = header;
  record->hash = hash;
  record->parent = parent;
  record->height = parent ? parent->height + 1 : 0;
  record->chain_work = (parent ? parent->chain_work : consensus::ChainWork::Zero()) +
                       consensus::ComputeBlockWork(header.difficulty_bits);
  BlockRecord* ptr = record.get();
  block_index_[hash] = std::move(record);
  return ptr;
}

bool ChainState::IsBetterThanTipLocked(const BlockRecord* candidate) const {
  const BlockRecord* tip = active_chain_.back();
  if (candidate->chain_work != tip->chain_work) {
    return candidate->chain_work > tip->chain_work;
  }
  // Equal work: the lexicographically lower hash wins, whatever the arrival
  // order.
  return candidate->hash < tip->hash;
}

bool ChainState::ConnectTipLocked(BlockRecord* record, const primitives::CBlock& block,
                                  const mutator_set::MutatorSetDelta& delta,
                                  consensus::ValidationState* state,
                                  std::vector<BlockNotification>* notifications) {
  std::string error;
  if (!archive_->AppendBlock(block, delta, &error)) {
    util::LogError("chain", "failed to append block " + ShortHash(record->hash) + ": " + error);
    return consensus::Reject(state, consensus::RejectReason::kStorageFailure, error);
  }
  mutator_set::MutatorSetDelta applied;
  if (!consensus::BlockMutatorSetUpdate(block).Apply(&mutator_set_, &applied, &error) ||
      mutator_set_.Hash() != block.header.mutator_set_root) {
    return MarkCorruptLocked("archival mutator set diverged at height " +
                                 std::to_string(record->height) + " " + error,
                             state);
  }
  record->in_active_chain = true;
  record->connected_once = true;
  active_chain_.push_back(record);
  SaveSnapshotLocked();
  notifications->push_back(MakeNotification(*record, block, true));
  util::LogInfo("chain", "new tip height " + std::to_string(record->height) + " " +
                             ShortHash(record->hash));
  return true;
}

bool ChainState::ReorganizeLocked(BlockRecord* candidate,
                                  const primitives::CBlock& candidate_block,
                                  consensus::ValidationState* state, ChainUpdate* update,
                                  std::vector<BlockNotification>* notifications) {
  std::vector<BlockRecord*> new_branch;
  for (BlockRecord* cursor = candidate; cursor && !cursor->in_active_chain;
       cursor = cursor->parent) {
    new_branch.push_back(cursor);
  }
  std::reverse(new_branch.begin(), new_branch.end());
  const BlockRecord* fork = new_branch.front()->parent;
  if (!fork) {
    return consensus::Reject(state, consensus::RejectReason::kUnknownPredecessor,
                             "branch does not connect to the active chain");
  }
  const std::uint64_t tip_height = active_chain_.back()->height;
  const std::uint64_t depth = tip_height - fork->height;
  if (depth > options_.max_reorg_depth) {
    ++telemetry_.rejected_deep_reorgs;
    util::LogWarn("chain", "rejecting reorganization of depth " + std::to_string(depth) +
                               " (limit " + std::to_string(options_.max_reorg_depth) +
                               ") to block " + ShortHash(candidate->hash));
    CacheSideBlockLocked(candidate->hash, candidate_block);
    return consensus::Reject(state, consensus::RejectReason::kReorgTooDeep,
                             "reorganization depth " + std::to_string(depth) + " exceeds " +
                                 std::to_string(options_.max_reorg_depth));
  }

  std::vector<primitives::CBlock> new_blocks;
  new_blocks.reserve(new_branch.size());
  for (const BlockRecord* record : new_branch) {
    if (record == candidate) {
      new_blocks.push_back(candidate_block);
    } else if (const auto* cached = FindSideBlockLocked(record->hash)) {
      new_blocks.push_back(*cached);
    } else {
      CacheSideBlockLocked(candidate->hash, candidate_block);
      return consensus::Reject(state, consensus::RejectReason::kStorageFailure,
                               "side-branch block " + ShortHash(record->hash) +
                                   " is no longer cached");
    }
  }

  std::vector<primitives::CBlock> old_blocks;
  std::vector<mutator_set::MutatorSetDelta> old_deltas;
  std::string error;
  if (depth > 0 &&
      !archive_->ForEach(
          fork->height + 1, tip_height,
          [&](std::uint64_t, const primitives::CBlock& block,
              const mutator_set::MutatorSetDelta& delta) {
            old_blocks.push_back(block);
            old_deltas.push_back(delta);
            return true;
          },
          &error)) {
    CacheSideBlockLocked(candidate->hash, candidate_block);
    return consensus::Reject(state, consensus::RejectReason::kStorageFailure, error);
  }

  // Revert the old branch on a working copy, newest block first.
  mutator_set::ArchivalMutatorSet working = mutator_set_;
  for (std::size_t i = old_blocks.size(); i-- > 0;) {
    if (!working.RevertRemove(old_deltas[i].flipped_indices, &error)) {
      return MarkCorruptLocked("revert of archived block failed: " + error, state);
    }
    const auto old_update = consensus::BlockMutatorSetUpdate(old_blocks[i]);
    for (auto it = old_update.additions.rbegin(); it != old_update.additions.rend(); ++it) {
      if (!working.RevertAdd(*it, &error)) {
        return MarkCorruptLocked("revert of archived block failed: " + error, state);
      }
    }
  }
  if (working.Hash() != fork->header.mutator_set_root) {
    return MarkCorruptLocked("reverted mutator set does not match fork block " +
                                 ShortHash(fork->hash),
                             state);
  }

  std::vector<mutator_set::MutatorSetDelta> new_deltas;
  new_deltas.reserve(new_blocks.size());
  for (std::size_t i = 0; i < new_blocks.size(); ++i) {
    BlockRecord* record = new_branch[i];
    consensus::ValidationState block_state;
    mutator_set::MutatorSetDelta delta;
    if (!consensus::ConnectBlockToAccumulator(new_blocks[i], &working, &delta, &block_state,
                                              !record->connected_once)) {
      if (record->connected_once) {
        return MarkCorruptLocked("replay of previously connected block " +
                                     ShortHash(record->hash) + " failed: " +
                                     block_state.ToString(),
                                 state);
      }
      MarkFailedLocked(record);
      util::LogWarn("chain", "reorganization aborted, block " + ShortHash(record->hash) +
                                 " invalid: " + block_state.ToString());
      return consensus::Reject(state, block_state.reason, block_state.detail);
    }
    new_deltas.push_back(std::move(delta));
  }

  if (!archive_->RollbackTo(fork->height, &error)) {
    util::LogError("chain", "archive rollback failed: " + error);
    CacheSideBlockLocked(candidate->hash, candidate_block);
    return consensus::Reject(state, consensus::RejectReason::kStorageFailure, error);
  }
  for (std::size_t i = 0; i < new_blocks.size(); ++i) {
    if (!archive_->AppendBlock(new_blocks[i], new_deltas[i], &error)) {
      util::LogError("chain", "append during reorganization failed: " + error);
      if (!RestoreArchiveLocked(fork->height, old_blocks, old_deltas)) {
        return MarkCorruptLocked("archive could not be restored after a failed reorganization",
                                 state);
      }
      CacheSideBlockLocked(candidate->hash, candidate_block);
      return consensus::Reject(state, consensus::RejectReason::kStorageFailure, error);
    }
  }

  mutator_set_ = std::move(working);
  for (std::size_t i = old_blocks.size(); i-- > 0;) {
    BlockRecord* old = active_chain_[static_cast<std::size_t>(fork->height + 1 + i)];
    old->in_active_chain = false;
    CacheSideBlockLocked(old->hash, old_blocks[i]);
    notifications->push_back(MakeNotification(*old, old_blocks[i], false));
    update->disconnected.push_back(old_blocks[i]);
  }
  active_chain_.resize(static_cast<std::size_t>(fork->height + 1));
  for (std::size_t i = 0; i < new_branch.size(); ++i) {
    BlockRecord* record = new_branch[i];
    record->in_active_chain = true;
    record->connected_once = true;
    active_chain_.push_back(record);
    RemoveSideBlockLocked(record->hash);
    notifications->push_back(MakeNotification(*record, new_blocks[i], true));
    update->connected.push_back(new_blocks[i]);
  }
  update->tip_changed = true;
  update->reorganized = depth > 0;
  if (depth > 0) {
    ++telemetry_.reorg_events;
    telemetry_.max_reorg_depth = std::max(telemetry_.max_reorg_depth, depth);
    util::LogInfo("chain", "reorganized " + std::to_string(depth) + " blocks at fork height " +
                               std::to_string(fork->height) + ", new tip " +
                               ShortHash(candidate->hash) + " at height " +
                               std::to_string(candidate->height));
  }
  SaveSnapshotLocked();
  return true;
}

bool ChainState::RestoreArchiveLocked(
    std::uint64_t fork_height, const std::vector<primitives::CBlock>& old_blocks,
    const std::vector<mutator_set::MutatorSetDelta>& old_deltas) {
  std::string error;
  if (!archive_->RollbackTo(fork_height, &error)) {
    util::LogError("chain", "restore rollback failed: " + error);
    return false;
  }
  for (std::size_t i = 0; i < old_blocks.size(); ++i) {
    if (!archive_->AppendBlock(old_blocks[i], old_deltas[i], &error)) {
      util::LogError("chain", "restore append failed: " + error);
      return false;
    }
  }
  return true;
}

void ChainState::MarkFailedLocked(BlockRecord* record) {
  record->failed = true;
  for (auto& [hash, entry] : block_index_) {
    for (const BlockRecord* cursor = entry->parent; cursor; cursor = cursor->parent) {
      if (cursor == record) {
        entry->failed = true;
        break;
      }
      if (cursor->height < record->height) {
        break;
      }
    }
  }
  for (auto& [hash, entry] : block_index_) {
    if (entry->failed) {
      RemoveSideBlockLocked(hash);
    }
  }
}

bool ChainState::MarkCorruptLocked(const std::string& detail, consensus::ValidationState* state) {
  telemetry_.corrupt = true;
  util::LogError("chain", "corrupt state, refusing further changes: " + detail);
  return consensus::Reject(state, consensus::RejectReason::kCorruptState, detail);
}

void ChainState::CacheSideBlockLocked(const primitives::Hash256& hash,
                                      const primitives::CBlock& block) {
  if (side_blocks_.count(hash) != 0) {
    return;
  }
  side_blocks_.emplace(hash, block);
  side_block_fifo_.push_back(hash);
  while (side_blocks_.size() > options_.max_side_blocks && !side_block_fifo_.empty()) {
    side_blocks_.erase(side_block_fifo_.front());
    side_block_fifo_.pop_front();
  }
}

void ChainState::RemoveSideBlockLocked(const primitives::Hash256& hash) {
  if (side_blocks_.erase(hash) == 0) {
    return;
  }
  side_block_fifo_.erase(std::remove(side_block_fifo_.begin(), side_block_fifo_.end(), hash),
                         side_block_fifo_.end());
}

const primitives::CBlock* ChainState::FindSideBlockLocked(const primitives::Hash256& hash) const {
  const auto it = side_blocks_.find(hash);
  return it == side_blocks_.end() ? nullptr : &it->second;
}

BlockNotification ChainState::MakeNotification(const BlockRecord& record,
                                               const primitives::CBlock& block, bool connected) {
  auto update = consensus::BlockMutatorSetUpdate(block);
  BlockNotification notification;
  notification.height = record.height;
  notification.hash = record.hash;
  notification.connected = connected;
  notification.additions = std::move(update.additions);
  notification.removals = std::move(update.removals);
  return notification;
}

void ChainState::Notify(const std::vector<BlockNotification>& notifications) const {
  if (notifications.empty()) {
    return;
  }
  std::vector<BlockListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto& notification : notifications) {
    for (const auto& listener : listeners) {
      listener(notification);
    }
  }
}

void ChainState::RegisterBlockListener(BlockListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

std::uint64_t ChainState::Now() const { return options_.clock(); }

primitives::Hash256 ChainState::TipHash() const {
  auto guard = lock_.Read();
  return active_chain_.empty() ? primitives::Hash256{} : active_chain_.back()->hash;
}

std::uint64_t ChainState::TipHeight() const {
  auto guard = lock_.Read();
  return active_chain_.empty() ? 0 : active_chain_.back()->height;
}

mutator_set::MutatorSetAccumulator ChainState::TipAccumulator() const {
  auto guard = lock_.Read();
  return mutator_set_.Snapshot();
}

TipState ChainState::CurrentTip() const {
  auto guard = lock_.Read();
  return TipStateLocked();
}

TipState ChainState::RefreshRemovalRecords(
    const std::vector<mutator_set::RemovalRecord*>& records) const {
  auto guard = lock_.Read();
  std::size_t stale = 0;
  for (auto* record : records) {
    std::string error;
    if (!mutator_set_.RefreshTargetChunks(record, &error)) {
      ++stale;
    }
  }
  if (stale != 0) {
    util::LogDebug("chain", std::to_string(stale) + " of " + std::to_string(records.size()) +
                                " removal records could not be refreshed");
  }
  return TipStateLocked();
}

TipState ChainState::TipStateLocked() const {
  TipState tip;
  if (!active_chain_.empty()) {
    tip.hash = active_chain_.back()->hash;
    tip.height = active_chain_.back()->height;
  }
  tip.accumulator = mutator_set_.Snapshot();
  return tip;
}

std::optional<TipSummary> ChainState::Tip() const {
  auto guard = lock_.Read();
  if (active_chain_.empty()) {
    return std::nullopt;
  }
  const BlockRecord* tip = active_chain_.back();
  return TipSummary{tip->hash, tip->height, tip->chain_work, tip->header};
}

primitives::Hash256 ChainState::AccumulatorRoot() const {
  auto guard = lock_.Read();
  return mutator_set_.Hash();
}

bool ChainState::Contains(const primitives::Hash256& hash) const {
  auto guard = lock_.Read();
  return block_index_.count(hash) != 0;
}

std::optional<BlockRecord> ChainState::GetRecord(const primitives::Hash256& hash) const {
  auto guard = lock_.Read();
  const auto it = block_index_.find(hash);
  if (it == block_index_.end()) {
    return std::nullopt;
  }
  return *it->second;
}

bool ChainState::GetBlock(const primitives::Hash256& hash, primitives::CBlock* block,
                          std::string* error) const {
  auto guard = lock_.Read();
  if (archive_ && archive_->HeightOf(hash)) {
    return archive_->GetBlockByHash(hash, block, error);
  }
  if (const auto* cached = FindSideBlockLocked(hash)) {
    if (block) *block = *cached;
    return true;
  }
  if (error) *error = "block not found";
  return false;
}

bool ChainState::GetBlockByHeight(std::uint64_t height, primitives::CBlock* block,
                                  std::string* error) const {
  auto guard = lock_.Read();
  if (!archive_) {
    if (error) *error = "chain not initialized";
    return false;
  }
  return archive_->GetBlockByHeight(height, block, error);
}

bool ChainState::GetBlockMmrProof(const primitives::Hash256& hash, BlockMmrProof* out,
                                  std::string* error) const {
  auto guard = lock_.Read();
  const auto height = archive_ ? archive_->HeightOf(hash) : std::nullopt;
  if (!height) {
    if (error) *error = "block is not on the canonical chain";
    return false;
  }
  BlockMmrProof proof;
  if (!archive_->GetMmrProof(*height, &proof.proof, error)) {
    return false;
  }
  proof.peaks = archive_->MmrPeaks();
  proof.leaf_count = archive_->MmrLeafCount();
  if (out) *out = std::move(proof);
  return true;
}

std::vector<primitives::Hash256> ChainState::GetChildren(const primitives::Hash256& hash) const {
  auto guard = lock_.Read();
  std::vector<primitives::Hash256> children;
  const auto it = block_index_.find(hash);
  if (it == block_index_.end()) {
    return children;
  }
  const BlockRecord* parent = it->second.get();
  for (const auto& kv : block_index_) {
    if (kv.second->parent == parent) {
      children.push_back(kv.first);
    }
  }
  std::sort(children.begin(), children.end());
  return children;
}

std::vector<primitives::Hash256> ChainState::GetAncestorHashes(const primitives::Hash256& hash,
                                                               std::size_t count) const {
  auto guard = lock_.Read();
  std::vector<primitives::Hash256> ancestors;
  const auto it = block_index_.find(hash);
  if (it == block_index_.end()) {
    return ancestors;
  }
  for (const BlockRecord* cursor = it->second->parent; cursor && ancestors.size() < count;
       cursor = cursor->parent) {
    ancestors.push_back(cursor->hash);
  }
  return ancestors;
}

ChainTelemetry ChainState::GetTelemetry() const {
  auto guard = lock_.Read();
  ChainTelemetry stats = telemetry_;
  stats.orphan_blocks = orphan_blocks_.load(std::memory_order_relaxed);
  return stats;
}

std::vector<ChainTipInfo> ChainState::GetChainTips() const {
  auto guard = lock_.Read();
  std::vector<ChainTipInfo> tips;
  if (block_index_.empty()) {
    return tips;
  }
  std::unordered_set<const BlockRecord*> has_child;
  has_child.reserve(block_index_.size());
  for (const auto& kv : block_index_) {
    if (kv.second->parent) {
      has_child.insert(kv.second->parent);
    }
  }
  const BlockRecord* best = active_chain_.empty() ? nullptr : active_chain_.back();
  for (const auto& kv : block_index_) {
    const BlockRecord* record = kv.second.get();
    if (has_child.count(record) != 0) {
      continue;
    }
    ChainTipInfo info;
    info.hash = record->hash;
    info.height = record->height;
    info.in_active_chain = record->in_active_chain;
    info.is_best_tip = record == best;
    info.failed = record->failed;
    for (const BlockRecord* cursor = record; cursor && !cursor->in_active_chain;
         cursor = cursor->parent) {
      ++info.branch_length;
    }
    tips.push_back(info);
  }
  std::sort(tips.begin(), tips.end(), [](const ChainTipInfo& a, const ChainTipInfo& b) {
    if (a.height != b.height) return a.height > b.height;
    return a.hash < b.hash;
  });
  return tips;
}

}  // namespace veil::node
