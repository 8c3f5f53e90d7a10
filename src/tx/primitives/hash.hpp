#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace veil::primitives {

using Hash256 = std::array<std::uint8_t, 32>;

struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::size_t result = 0;
    for (auto byte : hash) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

}  // namespace veil::primitives
