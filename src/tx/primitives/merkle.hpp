#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace veil::primitives {

Hash256 ComputeMerkleRoot(const std::vector<CTransaction>& transactions);

// Commits to the transaction list and the block-level proof.
Hash256 ComputeBodyRoot(const std::vector<CTransaction>& transactions,
                        const std::vector<std::uint8_t>& block_proof);

}  // namespace veil::primitives
