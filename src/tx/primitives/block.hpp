#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace veil::primitives {

struct CBlockHeader {
  std::uint32_t version{1};
  Hash256 previous_block_hash{};
  std::uint64_t height{0};
  std::uint64_t timestamp{0};
  std::uint32_t difficulty_bits{0};
  std::uint64_t nonce{0};
  // Commits to the transaction list and the block proof.
  Hash256 body_root{};
  // Mutator set root after applying this block.
  Hash256 mutator_set_root{};
  // Cumulative chain work including this block, big-endian.
  std::array<std::uint8_t, 32> cumulative_work{};

  bool operator==(const CBlockHeader& other) const = default;
};

struct CBlock {
  CBlockHeader header{};
  std::vector<CTransaction> transactions{};
  std::vector<std::uint8_t> proof{};

  bool operator==(const CBlock& other) const = default;
};

}  // namespace veil::primitives
