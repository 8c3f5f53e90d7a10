#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace veil::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);
// Decodes exactly 64 hex characters.
bool HexDecodeHash(std::string_view hex, std::array<std::uint8_t, 32>* out);

}  // namespace veil::util
