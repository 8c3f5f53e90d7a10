#include "consensus/mutator_set/chunk.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::mutator_set {

bool Chunk::Contains(std::uint32_t index) const {
  return std::binary_search(relative_indices.begin(), relative_indices.end(), index);
}

bool Chunk::Insert(std::uint32_t index) {
  auto it = std::lower_bound(relative_indices.begin(), relative_indices.end(), index);
  if (it != relative_indices.end() && *it == index) {
    return false;
  }
  relative_indices.insert(it, index);
  return true;
}

bool Chunk::Erase(std::uint32_t index) {
  auto it = std::lower_bound(relative_indices.begin(), relative_indices.end(), index);
  if (it == relative_indices.end() || *it != index) {
    return false;
  }
  relative_indices.erase(it);
  return true;
}

primitives::Hash256 Chunk::Hash() const {
  std::vector<std::uint8_t> buffer;
  primitives::serialize::SerializeChunk(*this, &buffer);
  const auto digest = crypto::TaggedSha3_256("veil/ms/chunk", {buffer});
  primitives::Hash256 out{};
  std::copy(digest.begin(), digest.end(), out.begin());
  return out;
}

}  // namespace veil::mutator_set
