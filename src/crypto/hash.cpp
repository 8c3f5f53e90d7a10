#include "crypto/hash.hpp"

#include <oqs/sha2.h>
#include <oqs/sha3.h>

namespace veil::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha3_256Hash DoubleSha3_256(std::span<const std::uint8_t> data) {
  const auto first = Sha3_256(data);
  return Sha3_256(first);
}

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash DoubleSha256(std::span<const std::uint8_t> data) {
  const auto first = Sha256(data);
  return Sha256(first);
}

Sha3_256Hash TaggedSha3_256(std::string_view tag,
                            std::initializer_list<std::span<const std::uint8_t>> parts) {
  std::size_t total = tag.size();
  for (const auto& part : parts) {
    total += part.size();
  }
  std::vector<std::uint8_t> preimage;
  preimage.reserve(total);
  preimage.insert(preimage.end(), tag.begin(), tag.end());
  for (const auto& part : parts) {
    preimage.insert(preimage.end(), part.begin(), part.end());
  }
  return Sha3_256(preimage);
}

std::vector<std::uint8_t> Sha3_256Vector(std::span<const std::uint8_t> data) {
  const auto hash = Sha3_256(data);
  return std::vector<std::uint8_t>(hash.begin(), hash.end());
}

}  // namespace veil::crypto
