#pragma once

#include "primitives/transaction.hpp"

namespace veil::primitives {

// Transaction id: SHA3-256 of the kernel with removal records stripped of
// their chunk authentication data.
Hash256 ComputeTxId(const CTransaction& tx);

}  // namespace veil::primitives
