#include "consensus/block_validator.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "consensus/block_hash.hpp"
#include "consensus/monetary.hpp"
#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "consensus/pow.hpp"
#include "consensus/tx_validator.hpp"
#include "primitives/merkle.hpp"
#include "primitives/serialize.hpp"

namespace veil::consensus {

namespace {

bool TargetIsZero(const std::array<std::uint8_t, 32>& target) {
  for (auto b : target) {
    if (b != 0) return false;
  }
  return true;
}

// Compares big-endian 256-bit targets.
bool TargetAbove(const std::array<std::uint8_t, 32>& a, const std::array<std::uint8_t, 32>& b) {
  return std::lexicographical_compare(b.begin(), b.end(), a.begin(), a.end());
}

std::uint32_t ClampTimestamp(std::uint64_t timestamp) {
  return timestamp > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<std::uint32_t>(timestamp);
}

}  // namespace

std::string_view BlockValidationStageName(BlockValidationStage stage) {
  switch (stage) {
    case BlockValidationStage::kReceived:
      return "received";
    case BlockValidationStage::kHeaderChecked:
      return "header-checked";
    case BlockValidationStage::kProofVerified:
      return "proof-verified";
    case BlockValidationStage::kAccumulatorApplied:
      return "accumulator-applied";
    case BlockValidationStage::kAccepted:
      return "accepted";
    case BlockValidationStage::kRejected:
      return "rejected";
  }
  return "unknown";
}

std::uint64_t MedianTimePast(std::vector<std::uint64_t> timestamps) {
  if (timestamps.empty()) {
    return 0;
  }
  std::sort(timestamps.begin(), timestamps.end());
  return timestamps[timestamps.size() / 2];
}

bool IsRetargetHeight(const ChainParams& params, std::uint64_t height) {
  return !params.pow_no_retargeting && params.difficulty_adjustment_interval != 0 &&
         height != 0 && height % params.difficulty_adjustment_interval == 0;
}

std::uint32_t NextWorkRequired(const ChainParams& params, std::uint64_t height,
                               const primitives::CBlockHeader& predecessor,
                               std::uint64_t interval_first_timestamp) {
  if (!IsRetargetHeight(params, height)) {
    return predecessor.difficulty_bits;
  }
  return CalculateNextWorkRequired(predecessor.difficulty_bits,
                                   ClampTimestamp(interval_first_timestamp),
                                   ClampTimestamp(predecessor.timestamp),
                                   params.target_block_time_seconds,
                                   params.difficulty_adjustment_interval, params.pow_limit_bits);
}

mutator_set::MutatorSetUpdate BlockMutatorSetUpdate(const primitives::CBlock& block) {
  mutator_set::MutatorSetUpdate update;
  for (const auto& tx : block.transactions) {
    update.additions.insert(update.additions.end(), tx.kernel.outputs.begin(),
                            tx.kernel.outputs.end());
    update.removals.insert(update.removals.end(), tx.kernel.inputs.begin(),
                           tx.kernel.inputs.end());
  }
  return update;
}

bool CheckBlockHeader(const primitives::CBlock& block, const HeaderContext& context,
                      const ChainParams& params, ValidationState* state) {
  const auto& header = block.header;
  const auto predecessor_hash = ComputeBlockHash(context.predecessor);
  if (header.previous_block_hash != predecessor_hash) {
    return Reject(state, RejectReason::kUnknownPredecessor, "predecessor mismatch");
  }
  if (header.height != context.predecessor.height + 1) {
    return Reject(state, RejectReason::kBadHeight,
                  "expected height " + std::to_string(context.predecessor.height + 1) + ", got " +
                      std::to_string(header.height));
  }
  if (header.timestamp <= context.median_time_past) {
    return Reject(state, RejectReason::kBadTimestamp, "timestamp not after median time past");
  }
  if (header.timestamp > context.now + params.max_future_block_time_seconds) {
    return Reject(state, RejectReason::kBadTimestamp, "timestamp too far in the future");
  }
  if (header.difficulty_bits != context.expected_bits) {
    return Reject(state, RejectReason::kBadDifficulty, "unexpected difficulty bits");
  }
  const ChainWork expected_work =
      context.predecessor_work + ComputeBlockWork(header.difficulty_bits);
  if (ChainWork::FromBigEndian(header.cumulative_work) != expected_work) {
    return Reject(state, RejectReason::kBadCumulativeWork, "cumulative work mismatch");
  }
  if (primitives::serialize::SerializedBlockSize(block) > params.max_block_serialized_bytes) {
    return Reject(state, RejectReason::kMalformed, "block exceeds size limit");
  }
  if (primitives::ComputeBodyRoot(block.transactions, block.proof) != header.body_root) {
    return Reject(state, RejectReason::kMalformed, "body root mismatch");
  }
  return true;
}

bool CheckProofOfWork(const primitives::CBlockHeader& header, const ChainParams& params,
                      ValidationState* state) {
  const auto target = CompactToTarget(header.difficulty_bits);
  if (TargetIsZero(target)) {
    return Reject(state, RejectReason::kInsufficientWork, "invalid difficulty target");
  }
  if (TargetAbove(target, CompactToTarget(params.pow_limit_bits))) {
    return Reject(state, RejectReason::kInsufficientWork, "target above pow limit");
  }
  if (!HashMeetsTarget(ComputeBlockHash(header), target)) {
    return Reject(state, RejectReason::kInsufficientWork, "insufficient proof-of-work");
  }
  return true;
}

bool CheckBlockBody(const primitives::CBlock& block, const ChainParams& params,
                    const crypto::ProofVerifier& verifier, ValidationState* state,
                    primitives::Amount* fees) {
  primitives::AmountTally total_fees;
  primitives::AmountTally total_coinbase;
  for (std::size_t i = 0; i < block.transactions.size(); ++i) {
    const auto& tx = block.transactions[i];
    ValidationState tx_state;
    if (!CheckTransactionStateless(tx, &tx_state) ||
        !VerifyTransactionProof(tx, verifier, &tx_state)) {
      return Reject(state, tx_state.reason, "tx " + std::to_string(i) + ": " + tx_state.detail);
    }
    if (!total_fees.Add(tx.kernel.fee) || !total_coinbase.Add(tx.kernel.coinbase)) {
      return Reject(state, RejectReason::kMalformed, "block amounts out of range");
    }
  }

  switch (verifier.Verify(BlockStatement(block.header, block.transactions), block.proof)) {
    case crypto::ProofVerdict::kValid:
      break;
    case crypto::ProofVerdict::kInvalid:
      return Reject(state, RejectReason::kProofInvalid, "block proof invalid");
    case crypto::ProofVerdict::kUnverified:
      return Reject(state, RejectReason::kUnverified, "block proof verification timed out");
  }

  primitives::Amount allowed = 0;
  const auto subsidy = CalculateBlockSubsidy(block.header.height, params.halving_interval_blocks);
  if (!primitives::CheckedAdd(subsidy, total_fees.Total(), &allowed) ||
      total_coinbase.Total() > allowed) {
    return Reject(state, RejectReason::kBadCoinbase,
                  "coinbase " + primitives::FormatAmount(total_coinbase.Total()) +
                      " exceeds subsidy plus fees " + primitives::FormatAmount(allowed));
  }
  if (fees) {
    *fees = total_fees.Total();
  }
  return true;
}

bool ConnectBlockToAccumulator(const primitives::CBlock& block, mutator_set::MutatorSet* set,
                               mutator_set::MutatorSetDelta* delta, ValidationState* state,
                               bool check_removability) {
  if (!set) {
    return Reject(state, RejectReason::kCorruptState, "missing accumulator");
  }
  if (check_removability) {
    for (std::size_t i = 0; i < block.transactions.size(); ++i) {
      ValidationState tx_state;
      if (!CheckTransactionInputs(block.transactions[i], *set, &tx_state)) {
        return Reject(state, tx_state.reason,
                      "tx " + std::to_string(i) + ": " + tx_state.detail);
      }
    }
  }
  std::set<primitives::Hash256> spent;
  for (const auto& tx : block.transactions) {
    for (const auto& input : tx.kernel.inputs) {
      if (!spent.insert(input.IndexSetDigest()).second) {
        return Reject(state, RejectReason::kDuplicateRemoval,
                      "two inputs in block spend the same output");
      }
    }
  }

  const auto update = BlockMutatorSetUpdate(block);
  std::string error;
  if (!update.Apply(set, delta, &error)) {
    return Reject(state, RejectReason::kInvalidRemoval, error);
  }
  if (set->Hash() != block.header.mutator_set_root) {
    return Reject(state, RejectReason::kAccumulatorMismatch,
                  "mutator set root does not match header");
  }
  return true;
}

BlockValidationResult ValidateBlock(const primitives::CBlock& block, const HeaderContext& context,
                                    const mutator_set::MutatorSet& predecessor_set,
                                    const ChainParams& params,
                                    const crypto::ProofVerifier& verifier) {
  BlockValidationResult result;
  auto reject = [&result]() -> BlockValidationResult& {
    result.stage = BlockValidationStage::kRejected;
    return result;
  };
  if (!CheckBlockHeader(block, context, params, &result.state)) {
    return reject();
  }
  result.stage = BlockValidationStage::kHeaderChecked;
  if (!CheckProofOfWork(block.header, params, &result.state) ||
      !CheckBlockBody(block, params, verifier, &result.state, &result.fees)) {
    return reject();
  }
  result.stage = BlockValidationStage::kProofVerified;
  mutator_set::MutatorSetAccumulator working = predecessor_set.Snapshot();
  if (!ConnectBlockToAccumulator(block, &working, &result.delta, &result.state)) {
    return reject();
  }
  result.resulting_root = working.Hash();
  result.stage = BlockValidationStage::kAccumulatorApplied;
  return result;
}

}  // namespace veil::consensus
