#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "consensus/mutator_set/mmr.hpp"
#include "consensus/mutator_set/mutator_set_update.hpp"
#include "primitives/block.hpp"
#include "primitives/hash.hpp"

namespace veil::storage {

// Durable history of the canonical chain. `blocks.dat` holds one record per
// height ([magic][size][sha3 checksum][block || delta]); `index.meta` says how
// many records and bytes of it are committed. A block MMR over the block
// hashes lets light clients check that a block belongs to the chain.
class ArchivalIndex {
 public:
  using Visitor = std::function<bool(std::uint64_t height, const primitives::CBlock& block,
                                     const mutator_set::MutatorSetDelta& delta)>;

  // Opens (creating if needed) the index in `dir`. Bytes past the committed
  // size are a torn append and are cut off. Committed records that are
  // missing or damaged are dropped along with everything after them.
  static std::unique_ptr<ArchivalIndex> Open(const std::filesystem::path& dir,
                                             std::uint32_t magic, std::string* error);

  ArchivalIndex(const ArchivalIndex&) = delete;
  ArchivalIndex& operator=(const ArchivalIndex&) = delete;

  // Appends the block at height BlockCount(). On failure the index is left
  // as it was.
  bool AppendBlock(const primitives::CBlock& block, const mutator_set::MutatorSetDelta& delta,
                   std::string* error);

  // Drops every block above `height`.
  bool RollbackTo(std::uint64_t height, std::string* error);

  std::uint64_t BlockCount() const noexcept { return entries_.size(); }
  bool Empty() const noexcept { return entries_.empty(); }
  std::optional<std::uint64_t> TipHeight() const;
  std::optional<primitives::Hash256> TipHash() const;
  std::optional<std::uint64_t> HeightOf(const primitives::Hash256& hash) const;

  bool GetHeader(std::uint64_t height, primitives::CBlockHeader* header) const;
  bool GetBlockHash(std::uint64_t height, primitives::Hash256* hash) const;
  bool GetBlockByHeight(std::uint64_t height, primitives::CBlock* block,
                        std::string* error) const;
  bool GetBlockByHash(const primitives::Hash256& hash, primitives::CBlock* block,
                      std::string* error) const;
  bool GetDelta(std::uint64_t height, mutator_set::MutatorSetDelta* delta,
                std::string* error) const;

  // Visits heights [from, to] in order until the visitor returns false.
  bool ForEach(std::uint64_t from, std::uint64_t to, const Visitor& visitor,
               std::string* error) const;

  bool GetMmrProof(std::uint64_t height, mutator_set::MmrMembershipProof* proof,
                   std::string* error) const;
  std::vector<primitives::Hash256> MmrPeaks() const { return block_mmr_.Peaks(); }
  std::uint64_t MmrLeafCount() const noexcept { return block_mmr_.LeafCount(); }
  static bool VerifyMmrProof(const primitives::Hash256& block_hash,
                             const mutator_set::MmrMembershipProof& proof,
                             const std::vector<primitives::Hash256>& peaks,
                             std::uint64_t leaf_count);

  const std::filesystem::path& Directory() const noexcept { return dir_; }

 private:
  struct Entry {
    primitives::Hash256 hash{};
    primitives::CBlockHeader header;
    std::uint64_t offset{0};
    std::uint64_t record_size{0};
  };

  ArchivalIndex(std::filesystem::path dir, std::uint32_t magic);

  bool Load(std::string* error);
  bool TrimToLoaded(std::uint64_t committed_count, std::uint64_t loaded_size,
                    const std::string& damage, std::string* error);
  bool WriteMeta(std::uint64_t record_count, std::uint64_t committed_size,
                 const primitives::Hash256& tip, std::string* error) const;
  bool ReadRecord(std::uint64_t height, primitives::CBlock* block,
                  mutator_set::MutatorSetDelta* delta, std::string* error) const;

  std::filesystem::path dir_;
  std::filesystem::path blocks_path_;
  std::filesystem::path meta_path_;
  std::uint32_t magic_;
  std::uint64_t committed_size_{0};
  std::vector<Entry> entries_;
  std::unordered_map<primitives::Hash256, std::uint64_t, primitives::Hash256Hasher> heights_;
  mutator_set::ArchivalMmr block_mmr_;
};

}  // namespace veil::storage
