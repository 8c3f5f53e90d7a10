#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/node_options.hpp"
#include "consensus/params.hpp"
#include "consensus/validation.hpp"
#include "crypto/proof_system.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "util/sync.hpp"

namespace veil::node {

struct NodeCoreOptions {
  std::filesystem::path data_dir;
  std::uint64_t max_reorg_depth{100};
  std::uint64_t mempool_max_bytes{64ULL * 1024 * 1024};
  std::size_t mempool_max_count{50'000};
  std::chrono::milliseconds proof_deadline{10'000};
  // UNIX seconds; defaults to the system clock.
  std::function<std::uint64_t()> clock;
};

NodeCoreOptions NodeCoreOptionsFrom(const config::NodeOptions& opts);

// Entry point for block and transaction submission. Block submissions are
// serialized so the mempool sees chain updates in order; transaction
// submissions run concurrently with them. The chain state is updated first
// and the mempool follows it.
class NodeCore {
 public:
  NodeCore(const consensus::ChainParams& params, NodeCoreOptions options,
           std::shared_ptr<const crypto::ProofVerifier> verifier);

  NodeCore(const NodeCore&) = delete;
  NodeCore& operator=(const NodeCore&) = delete;

  bool Initialize(std::string* error);

  bool SubmitBlock(const primitives::CBlock& block, consensus::ValidationState* state);
  bool SubmitTransaction(const primitives::CTransaction& tx, consensus::ValidationState* state);

  std::optional<TipSummary> GetTip() const;
  primitives::Hash256 GetAccumulatorRoot() const;
  std::vector<MempoolEntry> GetMempoolSnapshot() const;
  bool GetBlock(const primitives::Hash256& hash, primitives::CBlock* block,
                std::string* error) const;
  bool GetBlockProof(const primitives::Hash256& hash, BlockMmrProof* proof,
                     std::string* error) const;
  void RegisterBlockListener(BlockListener listener);

  ChainState& Chain() noexcept { return chain_; }
  const ChainState& Chain() const noexcept { return chain_; }
  Mempool& Pool() noexcept { return mempool_; }
  const Mempool& Pool() const noexcept { return mempool_; }

 private:
  void UpdateMempool(const ChainUpdate& update);

  const consensus::ChainParams& params_;
  std::shared_ptr<const crypto::ProofVerifier> verifier_;
  util::sync::RwLock submit_lock_{"block-submission"};
  ChainState chain_;
  Mempool mempool_;
};

}  // namespace veil::node
