#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace veil::consensus {

// Unsigned 256-bit quantity used for targets and accumulated proof-of-work.
// Arithmetic wraps modulo 2^256.
class ChainWork {
 public:
  ChainWork() = default;
  explicit ChainWork(std::uint64_t value);

  static ChainWork Zero() { return ChainWork(); }
  static ChainWork Max();

  static ChainWork FromBigEndian(std::span<const std::uint8_t, 32> bytes);
  std::array<std::uint8_t, 32> ToBigEndian() const;

  bool IsZero() const;
  // Index of the highest set bit plus one; zero for zero.
  int BitLength() const;

  ChainWork& operator+=(const ChainWork& other);
  ChainWork& operator-=(const ChainWork& other);
  void ShiftLeft(unsigned bits);

  // Three-way comparison: negative, zero or positive.
  static int Compare(const ChainWork& a, const ChainWork& b);

 private:
  // 32-bit words, least significant first.
  std::array<std::uint32_t, 8> words_{};

  friend ChainWork Divide(const ChainWork& dividend, const ChainWork& divisor);
};

// Truncating division; zero when dividing by zero.
ChainWork Divide(const ChainWork& dividend, const ChainWork& divisor);

inline ChainWork operator+(ChainWork lhs, const ChainWork& rhs) { return lhs += rhs; }
inline ChainWork operator-(ChainWork lhs, const ChainWork& rhs) { return lhs -= rhs; }

inline bool operator==(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) == 0; }
inline bool operator!=(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) != 0; }
inline bool operator<(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) < 0; }
inline bool operator>(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) > 0; }
inline bool operator<=(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) <= 0; }
inline bool operator>=(const ChainWork& a, const ChainWork& b) { return ChainWork::Compare(a, b) >= 0; }

}  // namespace veil::consensus
