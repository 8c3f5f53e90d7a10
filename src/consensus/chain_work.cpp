#include "consensus/chain_work.hpp"

namespace veil::consensus {

ChainWork::ChainWork(std::uint64_t value) {
  words_[0] = static_cast<std::uint32_t>(value);
  words_[1] = static_cast<std::uint32_t>(value >> 32);
}

ChainWork ChainWork::Max() {
  ChainWork out;
  out.words_.fill(0xFFFFFFFFu);
  return out;
}

ChainWork ChainWork::FromBigEndian(std::span<const std::uint8_t, 32> bytes) {
  ChainWork out;
  for (std::size_t w = 0; w < out.words_.size(); ++w) {
    const std::size_t at = bytes.size() - 4 * (w + 1);
    out.words_[w] = (std::uint32_t{bytes[at]} << 24) | (std::uint32_t{bytes[at + 1]} << 16) |
                    (std::uint32_t{bytes[at + 2]} << 8) | std::uint32_t{bytes[at + 3]};
  }
  return out;
}

std::array<std::uint8_t, 32> ChainWork::ToBigEndian() const {
  std::array<std::uint8_t, 32> out{};
  for (std::size_t w = 0; w < words_.size(); ++w) {
    const std::size_t at = out.size() - 4 * (w + 1);
    out[at] = static_cast<std::uint8_t>(words_[w] >> 24);
    out[at + 1] = static_cast<std::uint8_t>(words_[w] >> 16);
    out[at + 2] = static_cast<std::uint8_t>(words_[w] >> 8);
    out[at + 3] = static_cast<std::uint8_t>(words_[w]);
  }
  return out;
}

bool ChainWork::IsZero() const { return BitLength() == 0; }

int ChainWork::BitLength() const {
  for (std::size_t w = words_.size(); w-- > 0;) {
    if (words_[w] == 0) continue;
    int bits = 0;
    for (std::uint32_t v = words_[w]; v != 0; v >>= 1) ++bits;
    return static_cast<int>(w) * 32 + bits;
  }
  return 0;
}

ChainWork& ChainWork::operator+=(const ChainWork& other) {
  std::uint64_t carry = 0;
  for (std::size_t w = 0; w < words_.size(); ++w) {
    const std::uint64_t sum = std::uint64_t{words_[w]} + other.words_[w] + carry;
    words_[w] = static_cast<std::uint32_t>(sum);
    carry = sum >> 32;
  }
  return *this;
}

ChainWork& ChainWork::operator-=(const ChainWork& other) {
  std::int64_t borrow = 0;
  for (std::size_t w = 0; w < words_.size(); ++w) {
    std::int64_t diff = std::int64_t{words_[w]} - std::int64_t{other.words_[w]} - borrow;
    borrow = diff < 0 ? 1 : 0;
    if (diff < 0) diff += std::int64_t{1} << 32;
    words_[w] = static_cast<std::uint32_t>(diff);
  }
  return *this;
}

void ChainWork::ShiftLeft(unsigned bits) {
  if (bits >= 256) {
    words_.fill(0);
    return;
  }
  const std::size_t word_shift = bits / 32;
  const unsigned bit_shift = bits % 32;
  for (std::size_t w = words_.size(); w-- > 0;) {
    std::uint32_t value = 0;
    if (w >= word_shift) {
      value = words_[w - word_shift] << bit_shift;
      if (bit_shift != 0 && w > word_shift) {
        value |= words_[w - word_shift - 1] >> (32 - bit_shift);
      }
    }
    words_[w] = value;
  }
}

int ChainWork::Compare(const ChainWork& a, const ChainWork& b) {
  for (std::size_t w = a.words_.size(); w-- > 0;) {
    if (a.words_[w] != b.words_[w]) {
      return a.words_[w] < b.words_[w] ? -1 : 1;
    }
  }
  return 0;
}

ChainWork Divide(const ChainWork& dividend, const ChainWork& divisor) {
  if (divisor.IsZero()) {
    return ChainWork::Zero();
  }
  ChainWork quotient;
  ChainWork remainder;
  for (int bit = dividend.BitLength() - 1; bit >= 0; --bit) {
    remainder.ShiftLeft(1);
    const auto word = static_cast<std::size_t>(bit / 32);
    const auto mask = std::uint32_t{1} << (bit % 32);
    if (dividend.words_[word] & mask) {
      remainder.words_[0] |= 1u;
    }
    if (remainder >= divisor) {
      remainder -= divisor;
      quotient.words_[word] |= mask;
    }
  }
  return quotient;
}

}  // namespace veil::consensus
