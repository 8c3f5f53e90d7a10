#include "consensus/tx_validator.hpp"

#include <algorithm>
#include <set>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/amount.hpp"
#include "primitives/merkle.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"

namespace veil::consensus {

namespace {

bool VerdictToState(crypto::ProofVerdict verdict, const char* what, ValidationState* state) {
  switch (verdict) {
    case crypto::ProofVerdict::kValid:
      return true;
    case crypto::ProofVerdict::kInvalid:
      return Reject(state, RejectReason::kProofInvalid, std::string(what) + " proof invalid");
    case crypto::ProofVerdict::kUnverified:
      return Reject(state, RejectReason::kUnverified,
                    std::string(what) + " proof verification timed out");
  }
  return Reject(state, RejectReason::kProofInvalid, std::string(what) + " proof invalid");
}

}  // namespace

crypto::ProofStatement TransactionStatement(const primitives::Hash256& txid) {
  return crypto::TaggedSha3_256("veil/stmt/tx", {txid});
}

crypto::ProofStatement TransactionStatement(const primitives::CTransaction& tx) {
  return TransactionStatement(primitives::ComputeTxId(tx));
}

crypto::ProofStatement BlockStatement(const primitives::CBlockHeader& header,
                                      const std::vector<primitives::CTransaction>& transactions) {
  std::vector<std::uint8_t> height;
  primitives::serialize::WriteUint64(&height, header.height);
  const auto merkle = primitives::ComputeMerkleRoot(transactions);
  return crypto::TaggedSha3_256("veil/stmt/block",
                                {header.previous_block_hash, height, merkle});
}

bool CheckTransactionStateless(const primitives::CTransaction& tx, ValidationState* state) {
  const auto& kernel = tx.kernel;
  if (kernel.inputs.empty() && kernel.outputs.empty()) {
    return Reject(state, RejectReason::kMalformed, "transaction has no inputs and no outputs");
  }
  if (!primitives::MoneyRange(kernel.fee) || !primitives::MoneyRange(kernel.coinbase)) {
    return Reject(state, RejectReason::kMalformed, "amount out of range");
  }
  primitives::Amount claimed = 0;
  if (!primitives::CheckedAdd(kernel.fee, kernel.coinbase, &claimed)) {
    return Reject(state, RejectReason::kMalformed, "fee plus coinbase out of range");
  }
  std::set<primitives::Hash256> spent;
  for (const auto& input : kernel.inputs) {
    if (!input.HasWellFormedIndices()) {
      return Reject(state, RejectReason::kMalformed, "removal indices not sorted and distinct");
    }
    if (!spent.insert(input.IndexSetDigest()).second) {
      return Reject(state, RejectReason::kMalformed, "transaction spends an output twice");
    }
  }
  return true;
}

bool VerifyTransactionProof(const primitives::CTransaction& tx,
                            const crypto::ProofVerifier& verifier, ValidationState* state) {
  return VerdictToState(verifier.Verify(TransactionStatement(tx), tx.proof), "transaction",
                        state);
}

bool CheckTransactionInputs(const primitives::CTransaction& tx, const mutator_set::MutatorSet& set,
                            ValidationState* state) {
  for (std::size_t i = 0; i < tx.kernel.inputs.size(); ++i) {
    std::string reason;
    if (!set.CanRemove(tx.kernel.inputs[i], &reason)) {
      return Reject(state, RejectReason::kInvalidRemoval,
                    "input " + std::to_string(i) + ": " + reason);
    }
  }
  return true;
}

bool ValidateTransaction(const primitives::CTransaction& tx, const mutator_set::MutatorSet& set,
                         const crypto::ProofVerifier& verifier, ValidationState* state) {
  return CheckTransactionStateless(tx, state) && VerifyTransactionProof(tx, verifier, state) &&
         CheckTransactionInputs(tx, set, state);
}

bool MergeTransactions(const primitives::CTransaction& left, const primitives::CTransaction& right,
                       const crypto::ProofSystem& proofs, primitives::CTransaction* out,
                       std::string* error) {
  if (!out) {
    if (error) *error = "missing output transaction";
    return false;
  }
  std::set<primitives::Hash256> spent;
  for (const auto& input : left.kernel.inputs) {
    spent.insert(input.IndexSetDigest());
  }
  for (const auto& input : right.kernel.inputs) {
    if (spent.count(input.IndexSetDigest()) != 0) {
      if (error) *error = "transactions spend a common output";
      return false;
    }
  }

  primitives::CTransaction merged;
  merged.kernel.inputs = left.kernel.inputs;
  merged.kernel.inputs.insert(merged.kernel.inputs.end(), right.kernel.inputs.begin(),
                              right.kernel.inputs.end());
  merged.kernel.outputs = left.kernel.outputs;
  merged.kernel.outputs.insert(merged.kernel.outputs.end(), right.kernel.outputs.begin(),
                               right.kernel.outputs.end());
  if (!primitives::CheckedAdd(left.kernel.fee, right.kernel.fee, &merged.kernel.fee) ||
      !primitives::CheckedAdd(left.kernel.coinbase, right.kernel.coinbase,
                              &merged.kernel.coinbase)) {
    if (error) *error = "merged amounts out of range";
    return false;
  }
  merged.kernel.timestamp = std::max(left.kernel.timestamp, right.kernel.timestamp);

  if (!proofs.Merge(TransactionStatement(left), left.proof, TransactionStatement(right),
                    right.proof, TransactionStatement(merged), &merged.proof)) {
    if (error) *error = "input proof does not verify";
    return false;
  }
  *out = std::move(merged);
  return true;
}

}  // namespace veil::consensus
