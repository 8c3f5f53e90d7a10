#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace veil::crypto {

using ProofStatement = std::array<std::uint8_t, 32>;

enum class ProofVerdict {
  kValid,
  kInvalid,
  // The verifier gave up (deadline). Never treated as valid.
  kUnverified,
};

std::string_view ProofVerdictName(ProofVerdict verdict);

// Opaque, deterministic verification oracle over (statement digest, proof
// blob). The ledger only ever sees the verdict; the arithmetization behind a
// concrete verifier lives outside this code base.
class ProofVerifier {
 public:
  virtual ~ProofVerifier() = default;
  virtual ProofVerdict Verify(const ProofStatement& statement,
                              std::span<const std::uint8_t> proof) const = 0;
};

// Verifier that can also produce and merge proofs. Miners, wallets and tests
// use this side; validation only needs ProofVerifier.
class ProofSystem : public ProofVerifier {
 public:
  virtual std::vector<std::uint8_t> Prove(const ProofStatement& statement) const = 0;
  // Produces a proof for `merged` out of valid proofs for `left` and
  // `right`. Fails when either input proof does not verify.
  virtual bool Merge(const ProofStatement& left, std::span<const std::uint8_t> left_proof,
                     const ProofStatement& right, std::span<const std::uint8_t> right_proof,
                     const ProofStatement& merged, std::vector<std::uint8_t>* out) const = 0;
};

// Stand-in proof system: a proof is the tagged SHA3-256 of its statement.
// Deterministic and cheap, which is all the ledger relies on.
class HashCommitmentProofSystem final : public ProofSystem {
 public:
  ProofVerdict Verify(const ProofStatement& statement,
                      std::span<const std::uint8_t> proof) const override;
  std::vector<std::uint8_t> Prove(const ProofStatement& statement) const override;
  bool Merge(const ProofStatement& left, std::span<const std::uint8_t> left_proof,
             const ProofStatement& right, std::span<const std::uint8_t> right_proof,
             const ProofStatement& merged, std::vector<std::uint8_t>* out) const override;
};

// Runs the wrapped verifier on a worker thread and reports kUnverified if it
// has not answered within `deadline`. A zero deadline disables the limit.
class DeadlineProofVerifier final : public ProofVerifier {
 public:
  DeadlineProofVerifier(std::shared_ptr<const ProofVerifier> inner,
                        std::chrono::milliseconds deadline);

  ProofVerdict Verify(const ProofStatement& statement,
                      std::span<const std::uint8_t> proof) const override;

 private:
  std::shared_ptr<const ProofVerifier> inner_;
  std::chrono::milliseconds deadline_;
};

}  // namespace veil::crypto
