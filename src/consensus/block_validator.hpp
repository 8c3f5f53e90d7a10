#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "consensus/chain_work.hpp"
#include "consensus/mutator_set/mutator_set.hpp"
#include "consensus/mutator_set/mutator_set_update.hpp"
#include "consensus/params.hpp"
#include "consensus/validation.hpp"
#include "crypto/proof_system.hpp"
#include "primitives/amount.hpp"
#include "primitives/block.hpp"

namespace veil::consensus {

enum class BlockValidationStage {
  kReceived,
  kHeaderChecked,
  kProofVerified,
  kAccumulatorApplied,
  kAccepted,
  kRejected,
};

std::string_view BlockValidationStageName(BlockValidationStage stage);

// What the header rules need to know about the chain below a block. The
// chain-state manager fills it from its block index.
struct HeaderContext {
  primitives::CBlockHeader predecessor;
  ChainWork predecessor_work;
  std::uint64_t median_time_past{0};
  std::uint32_t expected_bits{0};
  // Local clock, UNIX seconds.
  std::uint64_t now{0};
};

// Median of up to `median_time_span` most recent timestamps.
std::uint64_t MedianTimePast(std::vector<std::uint64_t> timestamps);

// True when the block at `height` starts a new difficulty window.
bool IsRetargetHeight(const ChainParams& params, std::uint64_t height);

// Difficulty required for the block at `height`. `interval_first_timestamp`
// is the timestamp of the first block of the closing window and is only
// read at retarget heights.
std::uint32_t NextWorkRequired(const ChainParams& params, std::uint64_t height,
                               const primitives::CBlockHeader& predecessor,
                               std::uint64_t interval_first_timestamp);

// Additions in transaction then output order, removals in transaction then
// input order.
mutator_set::MutatorSetUpdate BlockMutatorSetUpdate(const primitives::CBlock& block);

// Stage 1: header fields against the predecessor, size limit and body root.
bool CheckBlockHeader(const primitives::CBlock& block, const HeaderContext& context,
                      const ChainParams& params, ValidationState* state);

// Stage 2: the header hash meets the target it claims.
bool CheckProofOfWork(const primitives::CBlockHeader& header, const ChainParams& params,
                      ValidationState* state);

// Stage 3, stateless part: transaction structure, transaction and block
// proofs, coinbase bound. Safe to run without any lock held.
bool CheckBlockBody(const primitives::CBlock& block, const ChainParams& params,
                    const crypto::ProofVerifier& verifier, ValidationState* state,
                    primitives::Amount* fees = nullptr);

// Stateful part against the predecessor accumulator: every input removable,
// no two inputs spending the same output, and the resulting root matches
// the header. `set` is advanced to the post-block state; on failure it may
// be partially updated, so callers pass a copy.
bool ConnectBlockToAccumulator(const primitives::CBlock& block, mutator_set::MutatorSet* set,
                               mutator_set::MutatorSetDelta* delta, ValidationState* state,
                               bool check_removability = true);

struct BlockValidationResult {
  BlockValidationStage stage{BlockValidationStage::kReceived};
  ValidationState state;
  primitives::Amount fees{0};
  mutator_set::MutatorSetDelta delta;
  primitives::Hash256 resulting_root{};
};

// Runs every stage in order against a copy of `predecessor_set`. A passing
// block ends at kAccumulatorApplied; committing it is the caller's job.
BlockValidationResult ValidateBlock(const primitives::CBlock& block, const HeaderContext& context,
                                    const mutator_set::MutatorSet& predecessor_set,
                                    const ChainParams& params,
                                    const crypto::ProofVerifier& verifier);

}  // namespace veil::consensus
