#include "consensus/monetary.hpp"

namespace veil::consensus {

primitives::Amount CalculateBlockSubsidy(std::uint64_t height, std::uint64_t halving_interval) {
  if (halving_interval == 0) {
    return kInitialSubsidy;
  }
  const auto halvings = height / halving_interval;
  if (halvings >= 64) {
    return 0;
  }

  primitives::Amount subsidy = kInitialSubsidy;
  subsidy >>= halvings;
  return subsidy;
}

}  // namespace veil::consensus
