#include "storage/mutator_set_snapshot.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace veil::storage {

namespace {

constexpr std::uint32_t kSnapshotMagic = 0x5353534d;  // 'MSSS'
constexpr std::uint32_t kSnapshotVersion = 1;

}  // namespace

bool SaveMutatorSetSnapshot(const std::filesystem::path& path,
                            const mutator_set::ArchivalMutatorSet& set, const SnapshotTip& tip,
                            std::string* error) {
  std::vector<std::uint8_t> buffer;
  primitives::serialize::WriteUint32(&buffer, kSnapshotMagic);
  primitives::serialize::WriteUint32(&buffer, kSnapshotVersion);
  primitives::serialize::WriteHash(&buffer, tip.block_hash);
  primitives::serialize::WriteUint64(&buffer, tip.height);
  const auto& leaves = set.AoclLeaves();
  primitives::serialize::WriteVarInt(&buffer, leaves.size());
  for (const auto& leaf : leaves) {
    primitives::serialize::WriteHash(&buffer, leaf);
  }
  const auto& chunks = set.Chunks();
  primitives::serialize::WriteVarInt(&buffer, chunks.size());
  for (const auto& chunk : chunks) {
    primitives::serialize::SerializeChunk(chunk, &buffer);
  }
  primitives::serialize::SerializeActiveWindow(set.Window(), &buffer);
  // The root lets the loader detect a snapshot that rebuilds to a different
  // state than the one it was taken from.
  primitives::serialize::WriteHash(&buffer, set.Hash());
  const auto checksum = crypto::Sha3_256(buffer);
  buffer.insert(buffer.end(), checksum.begin(), checksum.end());
  return util::AtomicWriteFileBytes(path, buffer, error);
}

bool LoadMutatorSetSnapshot(const std::filesystem::path& path, mutator_set::ArchivalMutatorSet* set,
                            SnapshotTip* tip, std::string* error) {
  if (!set || !tip) {
    if (error) *error = "missing output";
    return false;
  }
  std::vector<std::uint8_t> data;
  if (!util::ReadFileBytes(path, &data, error)) {
    return false;
  }
  if (data.size() < 32) {
    if (error) *error = "snapshot truncated";
    return false;
  }
  const std::size_t body_size = data.size() - 32;
  const auto actual = crypto::Sha3_256(std::span<const std::uint8_t>(data.data(), body_size));
  if (!std::equal(actual.begin(), actual.end(), data.begin() + static_cast<long>(body_size))) {
    if (error) *error = "snapshot checksum mismatch";
    return false;
  }
  data.resize(body_size);

  std::size_t offset = 0;
  std::uint32_t magic = 0;
  std::uint32_t version = 0;
  SnapshotTip decoded_tip;
  if (!primitives::serialize::ReadUint32(data, &offset, &magic) ||
      !primitives::serialize::ReadUint32(data, &offset, &version) || magic != kSnapshotMagic ||
      version != kSnapshotVersion) {
    if (error) *error = "not a mutator set snapshot";
    return false;
  }
  std::uint64_t leaf_count = 0;
  if (!primitives::serialize::ReadHash(data, &offset, &decoded_tip.block_hash) ||
      !primitives::serialize::ReadUint64(data, &offset, &decoded_tip.height) ||
      !primitives::serialize::ReadVarInt(data, &offset, &leaf_count) ||
      leaf_count > (data.size() - offset) / 32) {
    if (error) *error = "snapshot header malformed";
    return false;
  }
  std::vector<primitives::Hash256> leaves(static_cast<std::size_t>(leaf_count));
  for (auto& leaf : leaves) {
    if (!primitives::serialize::ReadHash(data, &offset, &leaf)) {
      if (error) *error = "snapshot leaves truncated";
      return false;
    }
  }
  std::uint64_t chunk_count = 0;
  if (!primitives::serialize::ReadVarInt(data, &offset, &chunk_count) ||
      chunk_count > data.size() - offset) {
    if (error) *error = "snapshot chunks malformed";
    return false;
  }
  std::vector<mutator_set::Chunk> chunks(static_cast<std::size_t>(chunk_count));
  for (auto& chunk : chunks) {
    if (!primitives::serialize::DeserializeChunk(data, &offset, &chunk)) {
      if (error) *error = "snapshot chunk malformed";
      return false;
    }
  }
  mutator_set::ActiveWindow window;
  primitives::Hash256 root{};
  if (!primitives::serialize::DeserializeActiveWindow(data, &offset, &window) ||
      !primitives::serialize::ReadHash(data, &offset, &root) || offset != data.size()) {
    if (error) *error = "snapshot window malformed";
    return false;
  }

  mutator_set::ArchivalMutatorSet restored;
  if (!mutator_set::ArchivalMutatorSet::FromParts(leaves, std::move(chunks), std::move(window),
                                                  &restored, error)) {
    return false;
  }
  if (restored.Hash() != root) {
    if (error) *error = "snapshot root mismatch";
    return false;
  }
  *set = std::move(restored);
  *tip = decoded_tip;
  return true;
}

}  // namespace veil::storage
