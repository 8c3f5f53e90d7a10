#include "consensus/mutator_set/mmr.hpp"

#include <algorithm>
#include <bit>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace veil::mutator_set {

namespace {

primitives::Hash256 ToHash256(const crypto::Sha3_256Hash& hash) {
  primitives::Hash256 out{};
  std::copy(hash.begin(), hash.end(), out.begin());
  return out;
}

}  // namespace

primitives::Hash256 HashMmrNode(const primitives::Hash256& left,
                                const primitives::Hash256& right) {
  return ToHash256(crypto::TaggedSha3_256("veil/mmr/node", {left, right}));
}

primitives::Hash256 BagPeaks(const std::vector<primitives::Hash256>& peaks,
                             std::uint64_t leaf_count) {
  std::vector<std::uint8_t> count_bytes;
  primitives::serialize::WriteUint64(&count_bytes, leaf_count);
  if (peaks.empty()) {
    return ToHash256(crypto::TaggedSha3_256("veil/mmr/bag", {count_bytes}));
  }
  primitives::Hash256 acc = peaks.back();
  for (std::size_t i = peaks.size() - 1; i-- > 0;) {
    acc = ToHash256(crypto::TaggedSha3_256("veil/mmr/bag", {peaks[i], acc}));
  }
  return ToHash256(crypto::TaggedSha3_256("veil/mmr/bag", {count_bytes, acc}));
}

bool LocateLeaf(std::uint64_t leaf_count, std::uint64_t leaf_index,
                std::size_t* peak_index, std::uint32_t* tree_height) {
  if (leaf_index >= leaf_count) {
    return false;
  }
  std::uint64_t offset = 0;
  std::size_t index = 0;
  for (int height = 63; height >= 0; --height) {
    const std::uint64_t size = std::uint64_t{1} << height;
    if ((leaf_count & size) == 0) {
      continue;
    }
    if (leaf_index < offset + size) {
      if (peak_index) *peak_index = index;
      if (tree_height) *tree_height = static_cast<std::uint32_t>(height);
      return true;
    }
    offset += size;
    ++index;
  }
  return false;
}

primitives::Hash256 MmrMembershipProof::ComputePeak(const primitives::Hash256& leaf) const {
  primitives::Hash256 node = leaf;
  for (std::size_t level = 0; level < authentication_path.size(); ++level) {
    if ((leaf_index >> level) & 1ULL) {
      node = HashMmrNode(authentication_path[level], node);
    } else {
      node = HashMmrNode(node, authentication_path[level]);
    }
  }
  return node;
}

bool MmrMembershipProof::Verify(const primitives::Hash256& leaf,
                                const std::vector<primitives::Hash256>& peaks,
                                std::uint64_t leaf_count) const {
  if (peaks.size() != static_cast<std::size_t>(std::popcount(leaf_count))) {
    return false;
  }
  std::size_t peak_index = 0;
  std::uint32_t height = 0;
  if (!LocateLeaf(leaf_count, leaf_index, &peak_index, &height)) {
    return false;
  }
  if (authentication_path.size() != height) {
    return false;
  }
  return ComputePeak(leaf) == peaks[peak_index];
}

void MmrMembershipProof::UpdateFromAppend(std::uint64_t old_leaf_count,
                                          const primitives::Hash256& new_leaf,
                                          const std::vector<primitives::Hash256>& old_peaks) {
  std::size_t peak_index = 0;
  std::uint32_t height = 0;
  if (!LocateLeaf(old_leaf_count, leaf_index, &peak_index, &height)) {
    return;
  }
  const auto merges = static_cast<std::uint32_t>(std::countr_one(old_leaf_count));
  if (height >= merges || old_peaks.size() < merges) {
    return;
  }
  primitives::Hash256 acc = new_leaf;
  for (std::uint32_t level = 0; level < merges; ++level) {
    const auto& left = old_peaks[old_peaks.size() - 1 - level];
    if (level == height) {
      authentication_path.push_back(acc);
    } else if (level > height) {
      authentication_path.push_back(left);
    }
    acc = HashMmrNode(left, acc);
  }
}

bool MmrMembershipProof::UpdateFromLeafMutation(const MmrMembershipProof& mutated,
                                                const primitives::Hash256& new_leaf) {
  if (mutated.leaf_index == leaf_index) {
    return false;
  }
  const std::size_t height = authentication_path.size();
  if (mutated.authentication_path.size() != height) {
    return false;
  }
  if (height < 64 && (leaf_index >> height) != (mutated.leaf_index >> height)) {
    return false;
  }
  const auto divergence =
      static_cast<std::size_t>(std::bit_width(leaf_index ^ mutated.leaf_index)) - 1;
  primitives::Hash256 node = new_leaf;
  for (std::size_t level = 0; level < divergence; ++level) {
    if ((mutated.leaf_index >> level) & 1ULL) {
      node = HashMmrNode(mutated.authentication_path[level], node);
    } else {
      node = HashMmrNode(node, mutated.authentication_path[level]);
    }
  }
  if (authentication_path[divergence] == node) {
    return false;
  }
  authentication_path[divergence] = node;
  return true;
}

MmrAccumulator::MmrAccumulator(std::vector<primitives::Hash256> peaks, std::uint64_t leaf_count)
    : peaks_(std::move(peaks)), leaf_count_(leaf_count) {}

MmrMembershipProof MmrAccumulator::Append(const primitives::Hash256& leaf) {
  MmrMembershipProof proof;
  proof.leaf_index = leaf_count_;
  primitives::Hash256 acc = leaf;
  const auto merges = std::countr_one(leaf_count_);
  for (int level = 0; level < merges && !peaks_.empty(); ++level) {
    const primitives::Hash256 left = peaks_.back();
    peaks_.pop_back();
    proof.authentication_path.push_back(left);
    acc = HashMmrNode(left, acc);
  }
  peaks_.push_back(acc);
  ++leaf_count_;
  return proof;
}

bool MmrAccumulator::MutateLeaf(const MmrMembershipProof& proof,
                                const primitives::Hash256& new_leaf) {
  std::size_t peak_index = 0;
  std::uint32_t height = 0;
  if (!LocateLeaf(leaf_count_, proof.leaf_index, &peak_index, &height)) {
    return false;
  }
  if (proof.authentication_path.size() != height || peak_index >= peaks_.size()) {
    return false;
  }
  peaks_[peak_index] = proof.ComputePeak(new_leaf);
  return true;
}

bool MmrAccumulator::Verify(const MmrMembershipProof& proof,
                            const primitives::Hash256& leaf) const {
  return proof.Verify(leaf, peaks_, leaf_count_);
}

void ArchivalMmr::Append(const primitives::Hash256& leaf) {
  if (levels_.empty()) {
    levels_.emplace_back();
  }
  levels_[0].push_back(leaf);
  std::uint64_t index = levels_[0].size() - 1;
  std::size_t height = 0;
  while (index & 1ULL) {
    if (levels_.size() <= height + 1) {
      levels_.emplace_back();
    }
    const auto& level = levels_[height];
    levels_[height + 1].push_back(
        HashMmrNode(level[static_cast<std::size_t>(index - 1)],
                    level[static_cast<std::size_t>(index)]));
    index >>= 1;
    ++height;
  }
}

bool ArchivalMmr::RemoveLast(primitives::Hash256* removed) {
  const std::uint64_t count = LeafCount();
  if (count == 0) {
    return false;
  }
  if (removed) {
    *removed = levels_[0].back();
  }
  const std::uint64_t remaining = count - 1;
  for (std::size_t height = 0; height < levels_.size(); ++height) {
    const std::uint64_t keep = remaining >> height;
    while (levels_[height].size() > keep) {
      levels_[height].pop_back();
    }
  }
  while (levels_.size() > 1 && levels_.back().empty()) {
    levels_.pop_back();
  }
  return true;
}

bool ArchivalMmr::MutateLeaf(std::uint64_t leaf_index, const primitives::Hash256& new_leaf) {
  if (leaf_index >= LeafCount()) {
    return false;
  }
  levels_[0][static_cast<std::size_t>(leaf_index)] = new_leaf;
  std::uint64_t index = leaf_index;
  for (std::size_t height = 0; height + 1 < levels_.size(); ++height) {
    const std::uint64_t parent = index >> 1;
    if (parent >= levels_[height + 1].size()) {
      break;
    }
    const auto& level = levels_[height];
    levels_[height + 1][static_cast<std::size_t>(parent)] =
        HashMmrNode(level[static_cast<std::size_t>(parent * 2)],
                    level[static_cast<std::size_t>(parent * 2 + 1)]);
    index = parent;
  }
  return true;
}

bool ArchivalMmr::GetLeaf(std::uint64_t leaf_index, primitives::Hash256* leaf) const {
  if (leaf_index >= LeafCount()) {
    return false;
  }
  if (leaf) {
    *leaf = levels_[0][static_cast<std::size_t>(leaf_index)];
  }
  return true;
}

bool ArchivalMmr::Prove(std::uint64_t leaf_index, MmrMembershipProof* proof) const {
  std::uint32_t height = 0;
  if (!LocateLeaf(LeafCount(), leaf_index, nullptr, &height)) {
    return false;
  }
  MmrMembershipProof out;
  out.leaf_index = leaf_index;
  out.authentication_path.reserve(height);
  for (std::uint32_t level = 0; level < height; ++level) {
    const std::uint64_t sibling = (leaf_index >> level) ^ 1ULL;
    out.authentication_path.push_back(levels_[level][static_cast<std::size_t>(sibling)]);
  }
  if (proof) {
    *proof = std::move(out);
  }
  return true;
}

std::vector<primitives::Hash256> ArchivalMmr::Peaks() const {
  std::vector<primitives::Hash256> peaks;
  const std::uint64_t count = LeafCount();
  std::uint64_t offset = 0;
  for (int height = 63; height >= 0; --height) {
    const std::uint64_t size = std::uint64_t{1} << height;
    if ((count & size) == 0) {
      continue;
    }
    peaks.push_back(levels_[static_cast<std::size_t>(height)]
                           [static_cast<std::size_t>(offset >> height)]);
    offset += size;
  }
  return peaks;
}

const std::vector<primitives::Hash256>& ArchivalMmr::Leaves() const {
  static const std::vector<primitives::Hash256> kEmpty;
  return levels_.empty() ? kEmpty : levels_[0];
}

}  // namespace veil::mutator_set
