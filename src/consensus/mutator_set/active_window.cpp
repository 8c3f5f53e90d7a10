#include "consensus/mutator_set/active_window.hpp"

#include <algorithm>

#include "consensus/mutator_set/shared.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::mutator_set {

ActiveWindow::ActiveWindow(std::vector<std::uint32_t> relative_indices)
    : indices_(std::move(relative_indices)) {
  std::sort(indices_.begin(), indices_.end());
  indices_.erase(std::unique(indices_.begin(), indices_.end()), indices_.end());
}

bool ActiveWindow::Contains(std::uint32_t index) const {
  return std::binary_search(indices_.begin(), indices_.end(), index);
}

bool ActiveWindow::Insert(std::uint32_t index) {
  auto it = std::lower_bound(indices_.begin(), indices_.end(), index);
  if (it != indices_.end() && *it == index) {
    return false;
  }
  indices_.insert(it, index);
  return true;
}

bool ActiveWindow::Remove(std::uint32_t index) {
  auto it = std::lower_bound(indices_.begin(), indices_.end(), index);
  if (it == indices_.end() || *it != index) {
    return false;
  }
  indices_.erase(it);
  return true;
}

Chunk ActiveWindow::FirstChunk() const {
  Chunk chunk;
  auto end = std::lower_bound(indices_.begin(), indices_.end(),
                              static_cast<std::uint32_t>(kChunkSize));
  chunk.relative_indices.assign(indices_.begin(), end);
  return chunk;
}

Chunk ActiveWindow::Slide() {
  Chunk chunk = FirstChunk();
  indices_.erase(indices_.begin(), indices_.begin() + chunk.relative_indices.size());
  for (auto& index : indices_) {
    index -= static_cast<std::uint32_t>(kChunkSize);
  }
  return chunk;
}

bool ActiveWindow::SlideBack(const Chunk& chunk) {
  const auto top = static_cast<std::uint32_t>(kWindowSize - kChunkSize);
  if (!indices_.empty() && indices_.back() >= top) {
    return false;
  }
  for (auto& index : indices_) {
    index += static_cast<std::uint32_t>(kChunkSize);
  }
  indices_.insert(indices_.begin(), chunk.relative_indices.begin(),
                  chunk.relative_indices.end());
  return true;
}

primitives::Hash256 ActiveWindow::Hash() const {
  std::vector<std::uint8_t> buffer;
  primitives::serialize::SerializeActiveWindow(*this, &buffer);
  const auto digest = crypto::TaggedSha3_256("veil/ms/window", {buffer});
  primitives::Hash256 out{};
  std::copy(digest.begin(), digest.end(), out.begin());
  return out;
}

}  // namespace veil::mutator_set
