#include "consensus/pow.hpp"

#include <algorithm>

namespace veil::consensus {

namespace {

using Target = std::array<std::uint8_t, 32>;

// Double-and-add; callers rule out overflow first.
ChainWork MultiplySmall(ChainWork value, std::uint64_t factor) {
  ChainWork product;
  while (factor != 0) {
    if (factor & 1u) {
      product += value;
    }
    value.ShiftLeft(1);
    factor >>= 1;
  }
  return product;
}

std::uint64_t ClampTimespan(std::uint64_t observed, std::uint64_t expected) {
  return std::clamp<std::uint64_t>(observed, expected / 4, expected * 4);
}

}  // namespace

Target CompactToTarget(std::uint32_t bits) {
  Target target{};
  const std::uint32_t size = bits >> 24;
  std::uint32_t word = bits & 0x007fffffu;
  if (size <= 3) {
    word >>= 8 * (3 - size);
    target[29] = static_cast<std::uint8_t>(word >> 16);
    target[30] = static_cast<std::uint8_t>(word >> 8);
    target[31] = static_cast<std::uint8_t>(word);
    return target;
  }
  // Byte k of the mantissa (little end first) lands at 31 - (size - 3) - k;
  // anything that would fall off the top is dropped.
  const long base = 31 - static_cast<long>(size - 3);
  for (long k = 0; k < 3; ++k) {
    const long pos = base - k;
    if (pos >= 0 && pos < 32) {
      target[static_cast<std::size_t>(pos)] = static_cast<std::uint8_t>(word >> (8 * k));
    }
  }
  return target;
}

std::uint32_t TargetToCompact(const Target& target) {
  const auto first = std::find_if(target.begin(), target.end(),
                                  [](std::uint8_t byte) { return byte != 0; });
  if (first == target.end()) {
    return 0;
  }
  std::uint32_t size = static_cast<std::uint32_t>(target.end() - first);
  std::uint32_t word = 0;
  for (std::uint32_t k = 0; k < 3; ++k) {
    word <<= 8;
    if (k < size) {
      word |= first[k];
    }
  }
  if (size < 3) {
    word >>= 8 * (3 - size);
  }
  // The sign bit of the mantissa must stay clear.
  if (word & 0x00800000u) {
    word >>= 8;
    ++size;
  }
  return (size << 24) | (word & 0x007fffffu);
}

bool HashMeetsTarget(const primitives::Hash256& hash, const Target& target) {
  return !std::lexicographical_compare(target.begin(), target.end(), hash.begin(), hash.end());
}

ChainWork ComputeBlockWork(std::uint32_t bits) {
  const auto target = ChainWork::FromBigEndian(CompactToTarget(bits));
  if (target.IsZero()) {
    return ChainWork::Zero();
  }
  return Divide(ChainWork::Max(), target + ChainWork(1));
}

std::uint32_t CalculateNextWorkRequired(std::uint32_t previous_bits,
                                        std::uint32_t first_timestamp,
                                        std::uint32_t last_timestamp,
                                        std::uint32_t target_spacing,
                                        std::uint32_t adjustment_interval,
                                        std::uint32_t pow_limit_bits) {
  if (adjustment_interval == 0 || target_spacing == 0) {
    return previous_bits;
  }
  const std::uint64_t expected =
      std::uint64_t{target_spacing} * std::uint64_t{adjustment_interval};
  const std::uint64_t observed =
      last_timestamp > first_timestamp ? last_timestamp - first_timestamp : expected;
  const std::uint64_t actual = ClampTimespan(observed, expected);

  // Already at the easiest difficulty and not asked to get harder.
  if (previous_bits == pow_limit_bits && actual >= expected) {
    return pow_limit_bits;
  }

  const auto previous = ChainWork::FromBigEndian(CompactToTarget(previous_bits));
  const auto limit = ChainWork::FromBigEndian(CompactToTarget(pow_limit_bits));
  ChainWork next;
  if (previous > Divide(ChainWork::Max(), ChainWork(actual))) {
    next = MultiplySmall(Divide(previous, ChainWork(expected)), actual);
  } else {
    next = Divide(MultiplySmall(previous, actual), ChainWork(expected));
  }
  if (next > limit) {
    next = limit;
  }
  return TargetToCompact(next.ToBigEndian());
}

}  // namespace veil::consensus
