#include "crypto/proof_system.hpp"

#include <algorithm>
#include <future>
#include <thread>

#include "crypto/hash.hpp"

namespace veil::crypto {

namespace {

constexpr std::string_view kProofTag = "veil/proof/v1";

}  // namespace

std::string_view ProofVerdictName(ProofVerdict verdict) {
  switch (verdict) {
    case ProofVerdict::kValid:
      return "valid";
    case ProofVerdict::kInvalid:
      return "invalid";
    case ProofVerdict::kUnverified:
      return "unverified";
  }
  return "unknown";
}

ProofVerdict HashCommitmentProofSystem::Verify(const ProofStatement& statement,
                                               std::span<const std::uint8_t> proof) const {
  const auto expected = TaggedSha3_256(kProofTag, {statement});
  if (proof.size() != expected.size() ||
      !std::equal(expected.begin(), expected.end(), proof.begin())) {
    return ProofVerdict::kInvalid;
  }
  return ProofVerdict::kValid;
}

std::vector<std::uint8_t> HashCommitmentProofSystem::Prove(const ProofStatement& statement) const {
  const auto digest = TaggedSha3_256(kProofTag, {statement});
  return std::vector<std::uint8_t>(digest.begin(), digest.end());
}

bool HashCommitmentProofSystem::Merge(const ProofStatement& left,
                                      std::span<const std::uint8_t> left_proof,
                                      const ProofStatement& right,
                                      std::span<const std::uint8_t> right_proof,
                                      const ProofStatement& merged,
                                      std::vector<std::uint8_t>* out) const {
  if (Verify(left, left_proof) != ProofVerdict::kValid ||
      Verify(right, right_proof) != ProofVerdict::kValid) {
    return false;
  }
  if (out) {
    *out = Prove(merged);
  }
  return true;
}

DeadlineProofVerifier::DeadlineProofVerifier(std::shared_ptr<const ProofVerifier> inner,
                                             std::chrono::milliseconds deadline)
    : inner_(std::move(inner)), deadline_(deadline) {}

ProofVerdict DeadlineProofVerifier::Verify(const ProofStatement& statement,
                                           std::span<const std::uint8_t> proof) const {
  if (!inner_) {
    return ProofVerdict::kUnverified;
  }
  if (deadline_.count() <= 0) {
    return inner_->Verify(statement, proof);
  }
  // The worker owns copies of everything it touches so it can outlive this
  // call when the deadline fires.
  auto promise = std::make_shared<std::promise<ProofVerdict>>();
  auto future = promise->get_future();
  std::thread worker([promise, inner = inner_, statement,
                      blob = std::vector<std::uint8_t>(proof.begin(), proof.end())]() {
    promise->set_value(inner->Verify(statement, blob));
  });
  worker.detach();
  if (future.wait_for(deadline_) != std::future_status::ready) {
    return ProofVerdict::kUnverified;
  }
  return future.get();
}

}  // namespace veil::crypto
