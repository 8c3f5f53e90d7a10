#include "primitives/txid.hpp"

#include <algorithm>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::primitives {

Hash256 ComputeTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransactionKernel(tx.kernel, &buffer, /*include_chunks=*/false);
  auto hash = crypto::Sha3_256(buffer);
  Hash256 result{};
  std::copy(hash.begin(), hash.end(), result.begin());
  return result;
}

}  // namespace veil::primitives
