#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace veil::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;
using Sha256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);
Sha3_256Hash DoubleSha3_256(std::span<const std::uint8_t> data);

// Standard FIPS-180-4 SHA-256 used for proof-of-work.
Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha256Hash DoubleSha256(std::span<const std::uint8_t> data);

// Domain-separated SHA3-256 over tag || parts[0] || parts[1] || ...
// Every accumulator and proof digest in the ledger goes through this so the
// preimage domains never overlap.
Sha3_256Hash TaggedSha3_256(std::string_view tag,
                            std::initializer_list<std::span<const std::uint8_t>> parts);

std::vector<std::uint8_t> Sha3_256Vector(std::span<const std::uint8_t> data);

}  // namespace veil::crypto
