#include "node/node_core.hpp"

#include <span>
#include <utility>

#include "consensus/tx_validator.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace veil::node {

namespace {

std::string HashToHex(const primitives::Hash256& hash) {
  return util::HexEncode(std::span<const std::uint8_t>(hash.data(), hash.size()));
}

std::shared_ptr<const crypto::ProofVerifier> WithDeadline(
    std::shared_ptr<const crypto::ProofVerifier> verifier, std::chrono::milliseconds deadline) {
  if (deadline.count() == 0) {
    return verifier;
  }
  return std::make_shared<crypto::DeadlineProofVerifier>(std::move(verifier), deadline);
}

}  // namespace

NodeCoreOptions NodeCoreOptionsFrom(const config::NodeOptions& opts) {
  NodeCoreOptions options;
  options.data_dir = opts.data_dir;
  options.max_reorg_depth = opts.max_reorg_depth;
  options.mempool_max_bytes = opts.mempool_max_bytes;
  options.mempool_max_count = opts.mempool_max_count;
  options.proof_deadline = std::chrono::milliseconds(opts.proof_deadline_ms);
  return options;
}

NodeCore::NodeCore(const consensus::ChainParams& params, NodeCoreOptions options,
                   std::shared_ptr<const crypto::ProofVerifier> verifier)
    : params_(params),
      verifier_(WithDeadline(std::move(verifier), options.proof_deadline)),
      chain_(params, ChainStateOptions{options.data_dir, options.max_reorg_depth, 1024,
                                       options.clock}),
      mempool_(MempoolOptions{options.mempool_max_bytes, options.mempool_max_count,
                              options.clock}) {}

bool NodeCore::Initialize(std::string* error) {
  if (!verifier_) {
    if (error) *error = "no proof verifier configured";
    return false;
  }
  if (!chain_.Initialize(error)) {
    return false;
  }
  mempool_.Revalidate(chain_);
  util::LogInfo("node", "ready on " + params_.network_id + " at height " +
                            std::to_string(chain_.TipHeight()));
  return true;
}

bool NodeCore::SubmitBlock(const primitives::CBlock& block, consensus::ValidationState* state) {
  consensus::ValidationState local_state;
  if (!state) {
    state = &local_state;
  }
  // The mempool follows the chain one update at a time, in chain order.
  auto guard = submit_lock_.Write();
  ChainUpdate update;
  if (!chain_.ProcessBlock(block, *verifier_, state, &update)) {
    return false;
  }
  UpdateMempool(update);
  return true;
}

void NodeCore::UpdateMempool(const ChainUpdate& update) {
  if (!update.tip_changed) {
    return;
  }
  if (!update.reorganized && update.connected.size() == 1 && update.predecessor_accumulator) {
    mempool_.RemoveConfirmed(update.connected.front(), update.predecessor_accumulator);
    return;
  }
  for (const auto& block : update.connected) {
    mempool_.RemoveConfirmed(block, std::nullopt);
  }
  mempool_.Revalidate(chain_);
  // Transactions from disconnected blocks go back to the pool when they are
  // still valid on the new chain.
  for (const auto& block : update.disconnected) {
    for (const auto& tx : block.transactions) {
      if (tx.IsCoinbase()) {
        continue;
      }
      consensus::ValidationState tx_state;
      if (!mempool_.Insert(tx, chain_, &tx_state)) {
        util::LogDebug("node", "not restoring " + HashToHex(primitives::ComputeTxId(tx)) +
                                   " after reorganization: " + tx_state.ToString());
      }
    }
  }
}

bool NodeCore::SubmitTransaction(const primitives::CTransaction& tx,
                                 consensus::ValidationState* state) {
  consensus::ValidationState local_state;
  if (!state) {
    state = &local_state;
  }
  if (!consensus::CheckTransactionStateless(tx, state) ||
      !consensus::VerifyTransactionProof(tx, *verifier_, state)) {
    util::LogDebug("node", "rejected transaction " + HashToHex(primitives::ComputeTxId(tx)) +
                               ": " + state->ToString());
    return false;
  }
  return mempool_.Insert(tx, chain_, state);
}

std::optional<TipSummary> NodeCore::GetTip() const { return chain_.Tip(); }

primitives::Hash256 NodeCore::GetAccumulatorRoot() const { return chain_.AccumulatorRoot(); }

std::vector<MempoolEntry> NodeCore::GetMempoolSnapshot() const { return mempool_.Snapshot(); }

bool NodeCore::GetBlock(const primitives::Hash256& hash, primitives::CBlock* block,
                        std::string* error) const {
  return chain_.GetBlock(hash, block, error);
}

bool NodeCore::GetBlockProof(const primitives::Hash256& hash, BlockMmrProof* proof,
                             std::string* error) const {
  return chain_.GetBlockMmrProof(hash, proof, error);
}

void NodeCore::RegisterBlockListener(BlockListener listener) {
  chain_.RegisterBlockListener(std::move(listener));
}

}  // namespace veil::node
