#pragma once

#include <cstdint>
#include <string>

namespace veil::primitives {

using Amount = std::uint64_t;  // Base units (1e-8 VEIL).

inline constexpr Amount kUnitsPerVeil = 100'000'000ULL;
// Total issuance cap. Every fee, coinbase and running sum stays within it.
inline constexpr Amount kMaxMoney = 42'000'000ULL * kUnitsPerVeil;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

// Writes a + b to |out| when both operands and the sum are in range.
inline constexpr bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (a > kMaxMoney || b > kMaxMoney - a) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

// Running sum that latches on the first out-of-range addition.
class AmountTally {
 public:
  bool Add(Amount value) noexcept {
    if (!valid_ || !CheckedAdd(total_, value, &total_)) {
      valid_ = false;
    }
    return valid_;
  }
  bool Valid() const noexcept { return valid_; }
  Amount Total() const noexcept { return total_; }

 private:
  Amount total_{0};
  bool valid_{true};
};

// Decimal VEIL without the unit, e.g. "12.000005" for 1200000500 units.
// Trailing fractional zeros are dropped; whole amounts print as "12".
std::string FormatAmount(Amount value);

}  // namespace veil::primitives
