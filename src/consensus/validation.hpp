#pragma once

#include <string>
#include <string_view>

namespace veil::consensus {

// Typed outcome of validating a block or transaction. Every rejection path
// returns one of these to the submitter; nothing is dropped silently.
enum class RejectReason {
  kNone,
  kMalformed,
  kUnknownPredecessor,
  kBadHeight,
  kBadTimestamp,
  kBadDifficulty,
  kBadCumulativeWork,
  kInsufficientWork,
  kProofInvalid,
  // Proof verification did not finish (deadline exceeded).
  kUnverified,
  kInvalidRemoval,
  kDuplicateRemoval,
  kBadCoinbase,
  kAccumulatorMismatch,
  kAlreadyKnown,
  kConflict,
  kFeeTooLow,
  kStorageFailure,
  kReorgTooDeep,
  // Persisted history and in-memory state diverged; the owner refuses
  // further mutation until restart.
  kCorruptState,
};

std::string_view RejectReasonName(RejectReason reason);

struct ValidationState {
  RejectReason reason{RejectReason::kNone};
  std::string detail;

  bool IsValid() const noexcept { return reason == RejectReason::kNone; }

  // Records the rejection and returns false so callers can
  // `return state->Invalid(...)`.
  bool Invalid(RejectReason why, std::string message) {
    reason = why;
    detail = std::move(message);
    return false;
  }

  std::string ToString() const;
};

// Helper for optional out-parameters.
inline bool Reject(ValidationState* state, RejectReason reason, std::string detail) {
  if (state) {
    return state->Invalid(reason, std::move(detail));
  }
  return false;
}

}  // namespace veil::consensus
