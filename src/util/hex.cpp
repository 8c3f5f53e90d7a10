#include "util/hex.hpp"

namespace veil::util {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

int Nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Decodes into `out`, which must hold hex.size() / 2 bytes.
bool DecodeInto(std::string_view hex, std::uint8_t* out) {
  for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
    const int hi = Nibble(hex[i]);
    const int lo = Nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i / 2] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (const auto byte : data) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  std::vector<std::uint8_t> bytes(hex.size() / 2);
  if (!DecodeInto(hex, bytes.data())) {
    out->clear();
    return false;
  }
  *out = std::move(bytes);
  return true;
}

bool HexDecodeHash(std::string_view hex, std::array<std::uint8_t, 32>* out) {
  std::array<std::uint8_t, 32> bytes{};
  if (hex.size() != 2 * bytes.size() || !DecodeInto(hex, bytes.data())) {
    return false;
  }
  *out = bytes;
  return true;
}

}  // namespace veil::util
