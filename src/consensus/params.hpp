#pragma once

#include <cstdint>
#include <string>

#include "config/network.hpp"
#include "primitives/amount.hpp"
#include "primitives/block.hpp"
#include "primitives/hash.hpp"

namespace veil::consensus {

struct ChainParams {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string network_id;
  std::uint32_t target_block_time_seconds{0};
  primitives::Amount max_supply{0};
  primitives::Amount initial_subsidy{0};
  std::uint64_t halving_interval_blocks{0};
  // Consensus cap on the serialized size of a block (header, transactions
  // and block proof).
  std::uint32_t max_block_serialized_bytes{0};
  std::uint32_t difficulty_adjustment_interval{0};
  // Regtest keeps the genesis difficulty forever.
  bool pow_no_retargeting{false};
  std::uint32_t pow_limit_bits{0};
  // Blocks whose timestamp is further ahead of local time are rejected.
  std::uint64_t max_future_block_time_seconds{0};
  // Number of predecessors whose median bounds a new block's timestamp.
  std::uint32_t median_time_span{0};
  std::uint32_t genesis_bits{0};
  std::uint64_t genesis_time{0};
  std::string genesis_message;
  primitives::CBlock genesis_block;
  primitives::Hash256 genesis_hash{};
};

const ChainParams& Params(config::NetworkType type);

}  // namespace veil::consensus
