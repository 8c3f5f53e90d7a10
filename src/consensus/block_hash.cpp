#include "consensus/block_hash.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/hex.hpp"

namespace veil::consensus {

primitives::Hash256 ComputeBlockHash(const primitives::CBlockHeader& header) {
  std::vector<std::uint8_t> encoded;
  encoded.reserve(kBlockHeaderEncodedSize);
  primitives::serialize::SerializeBlockHeader(header, &encoded);

  primitives::Hash256 hash{};
  const auto digest = crypto::DoubleSha256(encoded);
  std::copy(digest.begin(), digest.end(), hash.begin());
  return hash;
}

std::string BlockHashHex(const primitives::Hash256& hash, std::size_t digits) {
  auto hex = util::HexEncode(std::span<const std::uint8_t>(hash.data(), hash.size()));
  if (digits != 0 && digits < hex.size()) {
    hex.resize(digits);
  }
  return hex;
}

}  // namespace veil::consensus
