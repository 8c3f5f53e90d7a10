#include "primitives/merkle.hpp"

#include <algorithm>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/txid.hpp"

namespace veil::primitives {

namespace {

Hash256 ToHash(const crypto::Sha3_256Hash& digest) {
  Hash256 out{};
  std::copy(digest.begin(), digest.end(), out.begin());
  return out;
}

// Odd layers pair their last node with itself.
Hash256 FoldLayers(std::vector<Hash256> nodes) {
  while (nodes.size() > 1) {
    if (nodes.size() % 2 != 0) {
      nodes.push_back(nodes.back());
    }
    const std::size_t parents = nodes.size() / 2;
    for (std::size_t i = 0; i < parents; ++i) {
      nodes[i] = ToHash(crypto::TaggedSha3_256("veil/block/tx-node",
                                               {nodes[2 * i], nodes[2 * i + 1]}));
    }
    nodes.resize(parents);
  }
  return nodes.front();
}

}  // namespace

Hash256 ComputeMerkleRoot(const std::vector<CTransaction>& transactions) {
  if (transactions.empty()) {
    return Hash256{};
  }
  std::vector<Hash256> leaves(transactions.size());
  std::transform(transactions.begin(), transactions.end(), leaves.begin(),
                 [](const CTransaction& tx) { return ComputeTxId(tx); });
  return FoldLayers(std::move(leaves));
}

Hash256 ComputeBodyRoot(const std::vector<CTransaction>& transactions,
                        const std::vector<std::uint8_t>& block_proof) {
  const Hash256 merkle = ComputeMerkleRoot(transactions);
  const auto proof_digest = crypto::Sha3_256(block_proof);
  return ToHash(crypto::TaggedSha3_256("veil/block/body", {merkle, proof_digest}));
}

}  // namespace veil::primitives
