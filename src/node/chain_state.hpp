#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "consensus/block_validator.hpp"
#include "consensus/chain_work.hpp"
#include "consensus/mutator_set/archival_mutator_set.hpp"
#include "consensus/params.hpp"
#include "consensus/validation.hpp"
#include "crypto/proof_system.hpp"
#include "node/chain_view.hpp"
#include "primitives/block.hpp"
#include "storage/archival_index.hpp"
#include "util/sync.hpp"

namespace veil::node {

struct BlockRecord {
  primitives::CBlockHeader header{};
  primitives::Hash256 hash{};
  std::uint64_t height{0};
  consensus::ChainWork chain_work{};
  BlockRecord* parent{nullptr};
  bool in_active_chain{false};
  // Failed stateful validation; never activated again.
  bool failed{false};
  // Passed full validation against its predecessor's accumulator at least
  // once, so replaying it skips the removability checks.
  bool connected_once{false};
};

struct ChainTelemetry {
  std::uint64_t orphan_blocks{0};
  std::uint64_t reorg_events{0};
  std::uint64_t max_reorg_depth{0};
  std::uint64_t rejected_deep_reorgs{0};
  std::uint64_t snapshot_failures{0};
  bool snapshot_dirty{false};
  bool corrupt{false};
};

struct ChainTipInfo {
  primitives::Hash256 hash{};
  std::uint64_t height{0};
  bool in_active_chain{false};
  bool is_best_tip{false};
  bool failed{false};
  std::size_t branch_length{0};
};

struct TipSummary {
  primitives::Hash256 hash{};
  std::uint64_t height{0};
  consensus::ChainWork chain_work{};
  primitives::CBlockHeader header{};
};

// Delivered once per connected or disconnected block, after the chain lock
// has been released.
struct BlockNotification {
  std::uint64_t height{0};
  primitives::Hash256 hash{};
  bool connected{true};
  std::vector<mutator_set::AdditionRecord> additions;
  std::vector<mutator_set::RemovalRecord> removals;
};

using BlockListener = std::function<void(const BlockNotification&)>;

// What a successful ProcessBlock() did to the canonical chain.
struct ChainUpdate {
  bool tip_changed{false};
  bool reorganized{false};
  // Tip first.
  std::vector<primitives::CBlock> disconnected;
  // Ascending height.
  std::vector<primitives::CBlock> connected;
  // Set when exactly one block was connected on top of the old tip: the
  // accumulator that block was applied to.
  std::optional<mutator_set::MutatorSetAccumulator> predecessor_accumulator;
};

struct BlockMmrProof {
  mutator_set::MmrMembershipProof proof;
  std::vector<primitives::Hash256> peaks;
  std::uint64_t leaf_count{0};
};

struct ChainStateOptions {
  std::filesystem::path data_dir;
  std::uint64_t max_reorg_depth{100};
  std::size_t max_side_blocks{1024};
  // UNIX seconds; defaults to the system clock.
  std::function<std::uint64_t()> clock;
};

// Owns the canonical chain: block index, archival mutator set and archival
// index. Mutations happen under the chain write lock; proof verification of
// submitted blocks runs before it is taken.
class ChainState final : public ChainView {
 public:
  ChainState(const consensus::ChainParams& params, ChainStateOptions options);

  // Loads the archive (writing genesis into an empty one) and restores the
  // mutator set from its snapshot or by replaying the archive.
  bool Initialize(std::string* error);

  bool ProcessBlock(const primitives::CBlock& block, const crypto::ProofVerifier& verifier,
                    consensus::ValidationState* state, ChainUpdate* update = nullptr);

  primitives::Hash256 TipHash() const override;
  std::uint64_t TipHeight() const override;
  mutator_set::MutatorSetAccumulator TipAccumulator() const override;
  TipState CurrentTip() const override;
  TipState RefreshRemovalRecords(
      const std::vector<mutator_set::RemovalRecord*>& records) const override;

  std::optional<TipSummary> Tip() const;
  primitives::Hash256 AccumulatorRoot() const;
  bool Contains(const primitives::Hash256& hash) const;
  std::optional<BlockRecord> GetRecord(const primitives::Hash256& hash) const;
  bool GetBlock(const primitives::Hash256& hash, primitives::CBlock* block,
                std::string* error) const;
  bool GetBlockByHeight(std::uint64_t height, primitives::CBlock* block,
                        std::string* error) const;
  // Proof that the canonical block `hash` is in the block MMR.
  bool GetBlockMmrProof(const primitives::Hash256& hash, BlockMmrProof* out,
                        std::string* error) const;

  // Known blocks whose predecessor is `hash`, on any branch, ordered by hash.
  std::vector<primitives::Hash256> GetChildren(const primitives::Hash256& hash) const;
  // Up to `count` ancestors of `hash`, parent first. Empty for an unknown block.
  std::vector<primitives::Hash256> GetAncestorHashes(const primitives::Hash256& hash,
                                                     std::size_t count) const;

  ChainTelemetry GetTelemetry() const;
  std::vector<ChainTipInfo> GetChainTips() const;

  void RegisterBlockListener(BlockListener listener);

  const consensus::ChainParams& Params() const noexcept { return params_; }

 private:
  struct ContextSnapshot {
    consensus::HeaderContext header;
    bool parent_is_tip{false};
    primitives::Hash256 tip_hash{};
    std::optional<mutator_set::MutatorSetAccumulator> tip_accumulator;
  };

  bool PrepareContextLocked(const primitives::CBlock& block, const primitives::Hash256& hash,
                            ContextSnapshot* context, consensus::ValidationState* state) const;
  consensus::HeaderContext HeaderContextLocked(const BlockRecord* parent) const;
  const BlockRecord* AncestorLocked(const BlockRecord* from, std::uint64_t height) const;
  BlockRecord* AddRecordLocked(const primitives::CBlockHeader& header,
                               const primitives::Hash256& hash);
  bool IsBetterThanTipLocked(const BlockRecord* candidate) const;
  TipState TipStateLocked() const;

  bool ConnectTipLocked(BlockRecord* record, const primitives::CBlock& block,
                        const mutator_set::MutatorSetDelta& delta,
                        consensus::ValidationState* state,
                        std::vector<BlockNotification>* notifications);
  bool ReorganizeLocked(BlockRecord* candidate, const primitives::CBlock& candidate_block,
                        consensus::ValidationState* state, ChainUpdate* update,
                        std::vector<BlockNotification>* notifications);
  bool RestoreArchiveLocked(std::uint64_t fork_height,
                            const std::vector<primitives::CBlock>& old_blocks,
                            const std::vector<mutator_set::MutatorSetDelta>& old_deltas);
  void MarkFailedLocked(BlockRecord* record);
  bool MarkCorruptLocked(const std::string& detail, consensus::ValidationState* state);

  bool RebuildMutatorSetLocked(std::string* error);
  void SaveSnapshotLocked();

  void CacheSideBlockLocked(const primitives::Hash256& hash, const primitives::CBlock& block);
  void RemoveSideBlockLocked(const primitives::Hash256& hash);
  const primitives::CBlock* FindSideBlockLocked(const primitives::Hash256& hash) const;

  static BlockNotification MakeNotification(const BlockRecord& record,
                                            const primitives::CBlock& block, bool connected);
  void Notify(const std::vector<BlockNotification>& notifications) const;
  std::uint64_t Now() const;

  const consensus::ChainParams& params_;
  ChainStateOptions options_;
  std::filesystem::path snapshot_path_;

  mutable util::sync::RwLock lock_{"chain"};
  std::unique_ptr<storage::ArchivalIndex> archive_;
  mutator_set::ArchivalMutatorSet mutator_set_;
  std::unordered_map<primitives::Hash256, std::unique_ptr<BlockRecord>, primitives::Hash256Hasher>
      block_index_;
  std::vector<BlockRecord*> active_chain_;
  std::unordered_map<primitives::Hash256, primitives::CBlock, primitives::Hash256Hasher>
      side_blocks_;
  std::deque<primitives::Hash256> side_block_fifo_;
  ChainTelemetry telemetry_;
  mutable std::atomic<std::uint64_t> orphan_blocks_{0};

  mutable std::mutex listeners_mutex_;
  std::vector<BlockListener> listeners_;
};

}  // namespace veil::node
