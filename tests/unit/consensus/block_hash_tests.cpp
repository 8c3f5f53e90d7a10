#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/chain_work.hpp"
#include "consensus/mutator_set/mutator_set_accumulator.hpp"
#include "consensus/params.hpp"
#include "consensus/pow.hpp"
#include "crypto/hash.hpp"
#include "primitives/block.hpp"
#include "primitives/merkle.hpp"
#include "primitives/serialize.hpp"

using namespace veil;

namespace {

bool TestHeaderLayout() {
  primitives::CBlockHeader header;
  header.version = 0x01020304u;
  header.previous_block_hash.fill(0x11u);
  header.height = 0x0102030405060708ull;
  header.timestamp = (0x00000001ull << 32) | 0x00000002ull;
  header.difficulty_bits = 0x1d00ffffu;
  header.nonce = 0xA1B2C3D4E5F60718ull;
  header.body_root.fill(0x22u);
  header.mutator_set_root.fill(0x33u);
  header.cumulative_work.fill(0x44u);

  std::vector<std::uint8_t> encoded;
  primitives::serialize::SerializeBlockHeader(header, &encoded);
  if (encoded.size() != consensus::kBlockHeaderEncodedSize) {
    std::cerr << "block_hash_tests: expected a 160-byte header, got " << encoded.size() << "\n";
    return false;
  }
  if (encoded[0] != 0x04 || encoded[36] != 0x08 || encoded[43] != 0x01) {
    std::cerr << "block_hash_tests: integers must be little-endian\n";
    return false;
  }
  const auto sha = crypto::DoubleSha256(encoded);
  primitives::Hash256 expected{};
  std::copy(sha.begin(), sha.end(), expected.begin());
  const auto computed = consensus::ComputeBlockHash(header);
  if (computed != expected) {
    std::cerr << "block_hash_tests: block hash must be double SHA-256 of the header\n";
    return false;
  }
  auto changed = header;
  changed.mutator_set_root[0] ^= 1;
  if (consensus::ComputeBlockHash(changed) == computed) {
    std::cerr << "block_hash_tests: the accumulator root must be committed by the hash\n";
    return false;
  }

  const auto full = consensus::BlockHashHex(computed);
  const auto abbreviated = consensus::BlockHashHex(computed, 16);
  if (full.size() != 64 || abbreviated != full.substr(0, 16) ||
      consensus::BlockHashHex(computed, 200) != full) {
    std::cerr << "block_hash_tests: unexpected hash rendering " << full << "\n";
    return false;
  }
  primitives::Hash256 ordered{};
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    ordered[i] = static_cast<std::uint8_t>(i);
  }
  if (consensus::BlockHashHex(ordered, 6) != "000102") {
    std::cerr << "block_hash_tests: hashes render in encoding order\n";
    return false;
  }
  return true;
}

bool TestGenesis(config::NetworkType network) {
  const auto& params = consensus::Params(network);
  const auto& genesis = params.genesis_block;
  const std::string name(config::NetworkName(network));
  if (consensus::ComputeBlockHash(genesis.header) != params.genesis_hash) {
    std::cerr << "block_hash_tests: " << name << " genesis hash is stale\n";
    return false;
  }
  if (genesis.header.height != 0 || genesis.header.previous_block_hash != primitives::Hash256{}) {
    std::cerr << "block_hash_tests: " << name << " genesis must start the chain\n";
    return false;
  }
  if (primitives::ComputeBodyRoot(genesis.transactions, genesis.proof) !=
      genesis.header.body_root) {
    std::cerr << "block_hash_tests: " << name << " genesis body root mismatch\n";
    return false;
  }
  mutator_set::MutatorSetAccumulator set;
  mutator_set::MutatorSetDelta delta;
  std::string error;
  if (!consensus::BlockMutatorSetUpdate(genesis).Apply(&set, &delta, &error) ||
      set.Hash() != genesis.header.mutator_set_root) {
    std::cerr << "block_hash_tests: " << name << " genesis accumulator root mismatch " << error
              << "\n";
    return false;
  }
  if (consensus::ChainWork::FromBigEndian(genesis.header.cumulative_work) !=
      consensus::ComputeBlockWork(genesis.header.difficulty_bits)) {
    std::cerr << "block_hash_tests: " << name << " genesis work mismatch\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestHeaderLayout()) {
      return EXIT_FAILURE;
    }
    for (auto network : {config::NetworkType::kMainnet, config::NetworkType::kTestnet,
                         config::NetworkType::kRegtest}) {
      if (!TestGenesis(network)) {
        return EXIT_FAILURE;
      }
    }
    if (consensus::Params(config::NetworkType::kMainnet).genesis_hash ==
        consensus::Params(config::NetworkType::kRegtest).genesis_hash) {
      std::cerr << "block_hash_tests: networks must not share a genesis block\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "block_hash_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
