#pragma once

#include <cstddef>
#include <string>

#include "primitives/block.hpp"

namespace veil::consensus {

// Size of the canonical header encoding that the block hash commits to.
inline constexpr std::size_t kBlockHeaderEncodedSize = 160;

// Double SHA-256 over the canonical header encoding; identifies the block and
// is the proof-of-work hash.
primitives::Hash256 ComputeBlockHash(const primitives::CBlockHeader& header);

// Hex of the hash in encoding order. A non-zero |digits| keeps only that many
// leading characters, which is how log lines abbreviate blocks.
std::string BlockHashHex(const primitives::Hash256& hash, std::size_t digits = 0);

}  // namespace veil::consensus
