#include "consensus/validation.hpp"

namespace veil::consensus {

std::string_view RejectReasonName(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kMalformed:
      return "malformed";
    case RejectReason::kUnknownPredecessor:
      return "unknown-predecessor";
    case RejectReason::kBadHeight:
      return "bad-height";
    case RejectReason::kBadTimestamp:
      return "bad-timestamp";
    case RejectReason::kBadDifficulty:
      return "bad-difficulty";
    case RejectReason::kBadCumulativeWork:
      return "bad-cumulative-work";
    case RejectReason::kInsufficientWork:
      return "insufficient-work";
    case RejectReason::kProofInvalid:
      return "proof-invalid";
    case RejectReason::kUnverified:
      return "unverified";
    case RejectReason::kInvalidRemoval:
      return "invalid-removal";
    case RejectReason::kDuplicateRemoval:
      return "duplicate-removal";
    case RejectReason::kBadCoinbase:
      return "bad-coinbase";
    case RejectReason::kAccumulatorMismatch:
      return "accumulator-mismatch";
    case RejectReason::kAlreadyKnown:
      return "already-known";
    case RejectReason::kConflict:
      return "conflict";
    case RejectReason::kFeeTooLow:
      return "fee-too-low";
    case RejectReason::kStorageFailure:
      return "storage-failure";
    case RejectReason::kReorgTooDeep:
      return "reorg-too-deep";
    case RejectReason::kCorruptState:
      return "corrupt-state";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  std::string out(RejectReasonName(reason));
  if (!detail.empty()) {
    out += ": ";
    out += detail;
  }
  return out;
}

}  // namespace veil::consensus
