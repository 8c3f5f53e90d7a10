#include "consensus/params.hpp"

#include <span>
#include <string_view>

#include "consensus/block_hash.hpp"
#include "consensus/monetary.hpp"
#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "consensus/pow.hpp"
#include "crypto/hash.hpp"
#include "primitives/merkle.hpp"
#include "primitives/transaction.hpp"

namespace veil::consensus {

namespace {

constexpr std::uint32_t kMaxBlockSerializedBytes = 2u * 1024u * 1024u;  // 2 MiB
constexpr std::uint64_t kMaxFutureBlockTimeSeconds = 2 * 60 * 60;
constexpr std::uint32_t kMedianTimeSpan = 11;

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

// The genesis block mints the initial subsidy into a single output nobody
// can spend: its commitment is a hash of the genesis message.
primitives::CTransaction BuildGenesisTransaction(const std::string& message,
                                                 primitives::Amount reward,
                                                 std::uint64_t timestamp) {
  primitives::CTransaction tx;
  mutator_set::AdditionRecord output;
  output.canonical_commitment = crypto::TaggedSha3_256("veil/genesis/output", {AsBytes(message)});
  tx.kernel.outputs.push_back(output);
  tx.kernel.coinbase = reward;
  tx.kernel.fee = 0;
  tx.kernel.timestamp = timestamp;
  return tx;
}

primitives::CBlock CreateGenesisBlock(const std::string& message, primitives::Amount reward,
                                      std::uint64_t timestamp, std::uint32_t bits) {
  primitives::CBlock genesis;
  genesis.transactions = {BuildGenesisTransaction(message, reward, timestamp)};
  genesis.header.version = 1;
  genesis.header.previous_block_hash.fill(0);
  genesis.header.height = 0;
  genesis.header.timestamp = timestamp;
  genesis.header.difficulty_bits = bits;
  genesis.header.nonce = 0;
  genesis.header.body_root = primitives::ComputeBodyRoot(genesis.transactions, genesis.proof);

  mutator_set::MutatorSetAccumulator accumulator;
  for (const auto& output : genesis.transactions.front().kernel.outputs) {
    accumulator.Add(output);
  }
  genesis.header.mutator_set_root = accumulator.Hash();
  genesis.header.cumulative_work = ComputeBlockWork(bits).ToBigEndian();
  return genesis;
}

ChainParams BuildParams(config::NetworkType network, std::string network_id, std::uint32_t bits,
                        std::uint64_t timestamp, std::string message) {
  ChainParams params{};
  params.network = network;
  params.network_id = std::move(network_id);
  params.target_block_time_seconds = kTargetBlockSpacingSeconds;
  params.max_supply = primitives::kMaxMoney;
  params.initial_subsidy = kInitialSubsidy;
  params.halving_interval_blocks = kHalvingIntervalBlocks;
  params.max_block_serialized_bytes = kMaxBlockSerializedBytes;
  params.difficulty_adjustment_interval = 2016;
  params.pow_limit_bits = bits;
  params.max_future_block_time_seconds = kMaxFutureBlockTimeSeconds;
  params.median_time_span = kMedianTimeSpan;
  params.genesis_bits = bits;
  params.genesis_time = timestamp;
  params.genesis_message = std::move(message);
  params.genesis_block =
      CreateGenesisBlock(params.genesis_message, params.initial_subsidy, timestamp, bits);
  params.genesis_hash = ComputeBlockHash(params.genesis_block.header);
  return params;
}

}  // namespace

const ChainParams& Params(config::NetworkType type) {
  static const ChainParams mainnet = BuildParams(config::NetworkType::kMainnet, "mainnet",
                                                 0x1e0fffff, 1767225600, "Veil genesis - mainnet");
  static const ChainParams testnet = BuildParams(config::NetworkType::kTestnet, "testnet",
                                                 0x1f0fffff, 1767225601, "Veil genesis - testnet");
  static const ChainParams regtest = [] {
    ChainParams p = BuildParams(config::NetworkType::kRegtest, "regtest", 0x207fffff,
                                1760000000, "Veil genesis - regtest");
    // Short halvings so tests can reach a subsidy change.
    p.halving_interval_blocks = 150;
    p.pow_no_retargeting = true;
    return p;
  }();

  switch (type) {
    case config::NetworkType::kMainnet:
      return mainnet;
    case config::NetworkType::kTestnet:
      return testnet;
    case config::NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

}  // namespace veil::consensus
