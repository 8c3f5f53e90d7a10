#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "consensus/block_validator.hpp"
#include "consensus/params.hpp"
#include "consensus/pow.hpp"
#include "util/hex.hpp"

using namespace veil;

namespace {

using Target = std::array<std::uint8_t, 32>;

Target TargetFromHex(const std::string& hex) {
  Target out{};
  if (!util::HexDecodeHash(hex, &out)) {
    throw std::runtime_error("bad target hex " + hex);
  }
  return out;
}

bool TestCompactEncoding() {
  struct Vector {
    std::uint32_t bits;
    const char* target;
  };
  const Vector vectors[] = {
      {0x1d00ffffu, "00000000ffff0000000000000000000000000000000000000000000000000000"},
      {0x1b0404cbu, "00000000000404cb000000000000000000000000000000000000000000000000"},
      {0x207fffffu, "7fffff0000000000000000000000000000000000000000000000000000000000"},
  };
  for (const auto& v : vectors) {
    const auto target = consensus::CompactToTarget(v.bits);
    if (target != TargetFromHex(v.target)) {
      std::cerr << "pow_tests: CompactToTarget mismatch for 0x" << std::hex << v.bits << std::dec
                << "\n";
      return false;
    }
    if (consensus::TargetToCompact(target) != v.bits) {
      std::cerr << "pow_tests: TargetToCompact did not round-trip 0x" << std::hex << v.bits
                << std::dec << "\n";
      return false;
    }
  }
  if (consensus::TargetToCompact(Target{}) != 0 || consensus::CompactToTarget(0) != Target{}) {
    std::cerr << "pow_tests: zero target must encode as zero bits\n";
    return false;
  }
  return true;
}

bool TestHashMeetsTarget() {
  const auto target = consensus::CompactToTarget(0x1d00ffffu);
  primitives::Hash256 hash{};
  hash[4] = 0xff;
  hash[5] = 0xff;
  if (!consensus::HashMeetsTarget(hash, target)) {
    std::cerr << "pow_tests: hash equal to target must pass\n";
    return false;
  }
  hash[31] = 1;
  if (consensus::HashMeetsTarget(hash, target)) {
    std::cerr << "pow_tests: hash above target must fail\n";
    return false;
  }
  return true;
}

bool TestBlockWorkOrdering() {
  const auto easy = consensus::ComputeBlockWork(0x207fffffu);
  const auto hard = consensus::ComputeBlockWork(0x1d00ffffu);
  if (!(hard > easy) || easy.IsZero()) {
    std::cerr << "pow_tests: a smaller target must carry more work\n";
    return false;
  }
  if (!consensus::ComputeBlockWork(0).IsZero()) {
    std::cerr << "pow_tests: zero target must carry no work\n";
    return false;
  }
  // Target 0x7fffff.. is just under 2^255, so each block is worth two hashes.
  if (easy != consensus::ChainWork(2)) {
    std::cerr << "pow_tests: unexpected work for the regtest limit\n";
    return false;
  }
  return true;
}

bool TestRetargetClamps() {
  const std::uint32_t bits = 0x1f00ffffu;
  const std::uint32_t spacing = 60;
  const std::uint32_t interval = 20;
  const std::uint32_t limit = 0x207fffffu;
  const std::uint32_t timespan = spacing * interval;
  const std::uint32_t start = 1'700'000'000u;

  if (consensus::CalculateNextWorkRequired(bits, start, start + timespan, spacing, interval,
                                           limit) != bits) {
    std::cerr << "pow_tests: on-schedule interval must keep the difficulty\n";
    return false;
  }
  const auto before = consensus::CompactToTarget(bits);
  const auto fast = consensus::CompactToTarget(consensus::CalculateNextWorkRequired(
      bits, start, start + 1, spacing, interval, limit));
  const auto fast_clamped = consensus::CompactToTarget(consensus::CalculateNextWorkRequired(
      bits, start, start + timespan / 4, spacing, interval, limit));
  if (!(fast < before) || fast != fast_clamped) {
    std::cerr << "pow_tests: fast interval must tighten by at most a factor of four\n";
    return false;
  }
  const auto slow = consensus::CompactToTarget(consensus::CalculateNextWorkRequired(
      bits, start, start + timespan * 10, spacing, interval, limit));
  if (!(before < slow) || consensus::CompactToTarget(limit) < slow) {
    std::cerr << "pow_tests: slow interval must ease without passing the limit\n";
    return false;
  }
  if (consensus::CalculateNextWorkRequired(limit, start, start + timespan * 4, spacing, interval,
                                           limit) != limit) {
    std::cerr << "pow_tests: difficulty must stay pinned at the limit\n";
    return false;
  }
  return true;
}

bool TestRetargetSchedule() {
  const auto& mainnet = consensus::Params(config::NetworkType::kMainnet);
  const auto& regtest = consensus::Params(config::NetworkType::kRegtest);
  const auto interval = mainnet.difficulty_adjustment_interval;
  if (consensus::IsRetargetHeight(mainnet, 0) || consensus::IsRetargetHeight(mainnet, interval - 1) ||
      !consensus::IsRetargetHeight(mainnet, interval)) {
    std::cerr << "pow_tests: mainnet retargets exactly on interval boundaries\n";
    return false;
  }
  if (consensus::IsRetargetHeight(regtest, regtest.difficulty_adjustment_interval)) {
    std::cerr << "pow_tests: regtest never retargets\n";
    return false;
  }
  primitives::CBlockHeader predecessor;
  predecessor.difficulty_bits = mainnet.genesis_bits;
  predecessor.timestamp = mainnet.genesis_time + 10;
  if (consensus::NextWorkRequired(mainnet, 5, predecessor, mainnet.genesis_time) !=
      mainnet.genesis_bits) {
    std::cerr << "pow_tests: off-boundary heights inherit the predecessor bits\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestCompactEncoding() || !TestHashMeetsTarget() || !TestBlockWorkOrdering() ||
        !TestRetargetClamps() || !TestRetargetSchedule()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "pow_tests: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
