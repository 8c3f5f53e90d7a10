#pragma once

#include <cstdint>

#include "primitives/amount.hpp"

namespace veil::consensus {

inline constexpr std::uint32_t kTargetBlockSpacingSeconds = 600;
inline constexpr std::uint64_t kHalvingIntervalBlocks = 210'000;
inline constexpr primitives::Amount kInitialSubsidy = 50ULL * primitives::kUnitsPerVeil;

primitives::Amount CalculateBlockSubsidy(std::uint64_t height,
                                         std::uint64_t halving_interval = kHalvingIntervalBlocks);

}  // namespace veil::consensus
