#pragma once

#include <string>

#include "consensus/mutator_set/mutator_set.hpp"
#include "consensus/validation.hpp"
#include "crypto/proof_system.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace veil::consensus {

// Statement a transaction proof attests to. Derived from the txid, so
// refreshing the chunk data of an input does not invalidate the proof.
crypto::ProofStatement TransactionStatement(const primitives::Hash256& txid);
crypto::ProofStatement TransactionStatement(const primitives::CTransaction& tx);

// Statement of the block-level proof: predecessor, height and the ids of the
// included transactions.
crypto::ProofStatement BlockStatement(const primitives::CBlockHeader& header,
                                      const std::vector<primitives::CTransaction>& transactions);

// Structural rules that need no chain state: sorted distinct indices per
// input, no two inputs spending the same output, amounts in range.
bool CheckTransactionStateless(const primitives::CTransaction& tx, ValidationState* state);

bool VerifyTransactionProof(const primitives::CTransaction& tx,
                            const crypto::ProofVerifier& verifier, ValidationState* state);

// Every input must be removable from `set`.
bool CheckTransactionInputs(const primitives::CTransaction& tx, const mutator_set::MutatorSet& set,
                            ValidationState* state);

bool ValidateTransaction(const primitives::CTransaction& tx, const mutator_set::MutatorSet& set,
                         const crypto::ProofVerifier& verifier, ValidationState* state);

// Combines two valid transactions into one whose proof covers both. Fails
// when they spend a common output or either proof is invalid.
bool MergeTransactions(const primitives::CTransaction& left, const primitives::CTransaction& right,
                       const crypto::ProofSystem& proofs, primitives::CTransaction* out,
                       std::string* error);

}  // namespace veil::consensus
