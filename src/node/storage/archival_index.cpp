#include "storage/archival_index.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <system_error>

#include "consensus/block_hash.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"
#include "util/log.hpp"

namespace veil::storage {

namespace {

constexpr std::uint32_t kMetaMagic = 0x4d444956;  // 'VIDM'
constexpr std::uint32_t kMetaVersion = 1;
constexpr std::size_t kRecordHeaderSize = 8 + 32;
constexpr std::uint32_t kMaxRecordSize = 64u * 1024u * 1024u;

enum class RecordReadStatus {
  kOk,
  kEndOfFile,
  kTruncatedTail,
  kError,
};

bool ReadAll(std::ifstream* in, std::uint8_t* data, std::size_t len) {
  if (!in || !in->is_open()) return false;
  in->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
  return in->good();
}

bool WriteAll(std::ofstream* out, const std::uint8_t* data, std::size_t len) {
  if (!out || !out->is_open()) return false;
  out->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
  return out->good();
}

std::uint32_t DecodeU32LE(const std::uint8_t* data) {
  return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
         (static_cast<std::uint32_t>(data[2]) << 16) |
         (static_cast<std::uint32_t>(data[3]) << 24);
}

// Reads one record at the current stream position and checks its checksum.
RecordReadStatus ReadNextRecord(std::ifstream* in, std::uint32_t expected_magic,
                                std::vector<std::uint8_t>* payload,
                                std::uint64_t* record_bytes, std::string* error) {
  std::uint8_t header[8] = {0};
  in->read(reinterpret_cast<char*>(header), sizeof(header));
  if (in->gcount() == 0 && in->eof()) {
    return RecordReadStatus::kEndOfFile;
  }
  if (!in->good()) {
    return RecordReadStatus::kTruncatedTail;
  }
  const std::uint32_t magic = DecodeU32LE(header);
  const std::uint32_t size = DecodeU32LE(header + 4);
  if (magic != expected_magic) {
    if (error) *error = "bad record magic";
    return RecordReadStatus::kError;
  }
  if (size == 0 || size > kMaxRecordSize) {
    if (error) *error = "bad record size";
    return RecordReadStatus::kError;
  }
  crypto::Sha3_256Hash expected{};
  if (!ReadAll(in, expected.data(), expected.size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  payload->resize(size);
  if (!ReadAll(in, payload->data(), payload->size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  if (crypto::Sha3_256(*payload) != expected) {
    if (error) *error = "record checksum mismatch";
    return RecordReadStatus::kError;
  }
  if (record_bytes) {
    *record_bytes = kRecordHeaderSize + size;
  }
  return RecordReadStatus::kOk;
}

bool DecodePayload(const std::vector<std::uint8_t>& payload, primitives::CBlock* block,
                   mutator_set::MutatorSetDelta* delta) {
  std::size_t cursor = 0;
  primitives::CBlock decoded_block;
  mutator_set::MutatorSetDelta decoded_delta;
  if (!primitives::serialize::DeserializeBlock(payload, &cursor, &decoded_block) ||
      !primitives::serialize::DeserializeMutatorSetDelta(payload, &cursor, &decoded_delta) ||
      cursor != payload.size()) {
    return false;
  }
  if (block) *block = std::move(decoded_block);
  if (delta) *delta = std::move(decoded_delta);
  return true;
}

bool TruncateFile(const std::filesystem::path& path, std::uint64_t size, std::string* error) {
  std::error_code ec;
  std::filesystem::resize_file(path, size, ec);
  if (ec) {
    if (error) *error = "failed to truncate " + path.string() + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

ArchivalIndex::ArchivalIndex(std::filesystem::path dir, std::uint32_t magic)
    : dir_(std::move(dir)),
      blocks_path_(dir_ / "blocks.dat"),
      meta_path_(dir_ / "index.meta"),
      magic_(magic) {}

std::unique_ptr<ArchivalIndex> ArchivalIndex::Open(const std::filesystem::path& dir,
                                                   std::uint32_t magic, std::string* error) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (error) *error = "failed to create " + dir.string() + ": " + ec.message();
    return nullptr;
  }
  std::unique_ptr<ArchivalIndex> index(new ArchivalIndex(dir, magic));
  if (!index->Load(error)) {
    return nullptr;
  }
  return index;
}

bool ArchivalIndex::Load(std::string* error) {
  std::uint64_t record_count = 0;
  primitives::Hash256 tip{};
  committed_size_ = 0;

  std::error_code ec;
  if (std::filesystem::exists(meta_path_, ec)) {
    std::vector<std::uint8_t> meta;
    if (!util::ReadFileBytes(meta_path_, &meta, error)) {
      return false;
    }
    std::size_t offset = 0;
    std::uint32_t meta_magic = 0;
    std::uint32_t version = 0;
    std::uint32_t storage_magic = 0;
    primitives::Hash256 checksum{};
    if (!primitives::serialize::ReadUint32(meta, &offset, &meta_magic) ||
        !primitives::serialize::ReadUint32(meta, &offset, &version) ||
        !primitives::serialize::ReadUint32(meta, &offset, &storage_magic) ||
        !primitives::serialize::ReadUint64(meta, &offset, &record_count) ||
        !primitives::serialize::ReadUint64(meta, &offset, &committed_size_) ||
        !primitives::serialize::ReadHash(meta, &offset, &tip)) {
      if (error) *error = "index.meta truncated";
      return false;
    }
    const std::size_t body_size = offset;
    if (!primitives::serialize::ReadHash(meta, &offset, &checksum) || offset != meta.size()) {
      if (error) *error = "index.meta truncated";
      return false;
    }
    const auto actual =
        crypto::Sha3_256(std::span<const std::uint8_t>(meta.data(), body_size));
    if (meta_magic != kMetaMagic || version != kMetaVersion || actual != checksum) {
      if (error) *error = "index.meta is corrupt";
      return false;
    }
    if (storage_magic != magic_) {
      if (error) *error = "index.meta belongs to a different network";
      return false;
    }
  }

  std::uint64_t file_size = 0;
  if (std::filesystem::exists(blocks_path_, ec)) {
    file_size = std::filesystem::file_size(blocks_path_, ec);
    if (ec) {
      if (error) *error = "failed to stat blocks.dat: " + ec.message();
      return false;
    }
  }
  if (file_size < committed_size_) {
    util::LogWarn("storage", "blocks.dat holds " + std::to_string(file_size) + " of " +
                                 std::to_string(committed_size_) + " committed bytes");
  } else if (file_size > committed_size_) {
    util::LogWarn("storage", "discarding " + std::to_string(file_size - committed_size_) +
                                 " uncommitted bytes at the end of blocks.dat");
    if (!TruncateFile(blocks_path_, committed_size_, error)) {
      return false;
    }
  }

  entries_.clear();
  heights_.clear();
  block_mmr_ = mutator_set::ArchivalMmr();
  if (record_count == 0) {
    return true;
  }

  if (file_size == 0) {
    return TrimToLoaded(record_count, 0, "is empty", error);
  }
  std::ifstream in(blocks_path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "failed to open blocks.dat";
    return false;
  }
  std::uint64_t offset = 0;
  std::vector<std::uint8_t> payload;
  std::string damage;
  while (entries_.size() < record_count) {
    std::uint64_t record_bytes = 0;
    std::string record_error;
    const auto status = ReadNextRecord(&in, magic_, &payload, &record_bytes, &record_error);
    if (status != RecordReadStatus::kOk) {
      damage = "record " + std::to_string(entries_.size()) + ": " +
               (record_error.empty() ? std::string("truncated") : record_error);
      break;
    }
    primitives::CBlock block;
    if (!DecodePayload(payload, &block, nullptr)) {
      damage = "record " + std::to_string(entries_.size()) + " malformed";
      break;
    }
    Entry entry;
    entry.hash = consensus::ComputeBlockHash(block.header);
    entry.header = block.header;
    entry.offset = offset;
    entry.record_size = record_bytes;
    heights_[entry.hash] = entries_.size();
    block_mmr_.Append(entry.hash);
    entries_.push_back(std::move(entry));
    offset += record_bytes;
  }
  if (!damage.empty()) {
    return TrimToLoaded(record_count, offset, damage, error);
  }
  if (offset != committed_size_ || entries_.back().hash != tip) {
    if (error) *error = "blocks.dat does not match index.meta";
    return false;
  }
  return true;
}

// Commits the intact prefix read by Load() after the rest of the committed
// records turned out to be missing or damaged, as after a crash that lost
// unsynced data pages.
bool ArchivalIndex::TrimToLoaded(std::uint64_t committed_count, std::uint64_t loaded_size,
                                 const std::string& damage, std::string* error) {
  util::LogError("storage", "blocks.dat " + damage + "; keeping " +
                                std::to_string(entries_.size()) + " of " +
                                std::to_string(committed_count) + " committed blocks");
  std::error_code ec;
  if (std::filesystem::exists(blocks_path_, ec) &&
      !TruncateFile(blocks_path_, loaded_size, error)) {
    return false;
  }
  const primitives::Hash256 tip = entries_.empty() ? primitives::Hash256{} : entries_.back().hash;
  if (!WriteMeta(entries_.size(), loaded_size, tip, error)) {
    return false;
  }
  committed_size_ = loaded_size;
  return true;
}

bool ArchivalIndex::WriteMeta(std::uint64_t record_count, std::uint64_t committed_size,
                              const primitives::Hash256& tip, std::string* error) const {
  std::vector<std::uint8_t> meta;
  primitives::serialize::WriteUint32(&meta, kMetaMagic);
  primitives::serialize::WriteUint32(&meta, kMetaVersion);
  primitives::serialize::WriteUint32(&meta, magic_);
  primitives::serialize::WriteUint64(&meta, record_count);
  primitives::serialize::WriteUint64(&meta, committed_size);
  primitives::serialize::WriteHash(&meta, tip);
  const auto checksum = crypto::Sha3_256(meta);
  meta.insert(meta.end(), checksum.begin(), checksum.end());
  return util::AtomicWriteFileBytes(meta_path_, meta, error);
}

bool ArchivalIndex::AppendBlock(const primitives::CBlock& block,
                                const mutator_set::MutatorSetDelta& delta, std::string* error) {
  std::vector<std::uint8_t> payload;
  primitives::serialize::SerializeBlock(block, &payload);
  primitives::serialize::SerializeMutatorSetDelta(delta, &payload);
  if (payload.size() > kMaxRecordSize) {
    if (error) *error = "block record exceeds size cap";
    return false;
  }
  const auto checksum = crypto::Sha3_256(payload);

  // A previous failed append may have left bytes past the committed size.
  std::error_code ec;
  if (std::filesystem::exists(blocks_path_, ec) &&
      std::filesystem::file_size(blocks_path_, ec) != committed_size_) {
    if (!TruncateFile(blocks_path_, committed_size_, error)) {
      return false;
    }
  }

  {
    std::ofstream out(blocks_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
      if (error) *error = "failed to open blocks.dat for append";
      return false;
    }
    std::vector<std::uint8_t> header;
    primitives::serialize::WriteUint32(&header, magic_);
    primitives::serialize::WriteUint32(&header, static_cast<std::uint32_t>(payload.size()));
    header.insert(header.end(), checksum.begin(), checksum.end());
    if (!WriteAll(&out, header.data(), header.size()) ||
        !WriteAll(&out, payload.data(), payload.size())) {
      if (error) *error = "failed to write block record";
      return false;
    }
    out.flush();
    if (!out.good()) {
      if (error) *error = "failed to flush blocks.dat";
      return false;
    }
  }
  // The record must be durable before index.meta counts it.
  if (!util::SyncFile(blocks_path_, error)) {
    std::string truncate_error;
    if (!TruncateFile(blocks_path_, committed_size_, &truncate_error)) {
      util::LogError("storage", "append rollback failed: " + truncate_error);
    }
    return false;
  }

  const std::uint64_t record_size = kRecordHeaderSize + payload.size();
  const auto hash = consensus::ComputeBlockHash(block.header);
  std::string meta_error;
  if (!WriteMeta(entries_.size() + 1, committed_size_ + record_size, hash, &meta_error)) {
    std::string truncate_error;
    if (!TruncateFile(blocks_path_, committed_size_, &truncate_error)) {
      util::LogError("storage", "append rollback failed: " + truncate_error);
    }
    if (error) *error = meta_error;
    return false;
  }

  Entry entry;
  entry.hash = hash;
  entry.header = block.header;
  entry.offset = committed_size_;
  entry.record_size = record_size;
  heights_[hash] = entries_.size();
  entries_.push_back(std::move(entry));
  committed_size_ += record_size;
  block_mmr_.Append(hash);
  return true;
}

bool ArchivalIndex::RollbackTo(std::uint64_t height, std::string* error) {
  if (height + 1 >= entries_.size()) {
    return true;
  }
  const std::uint64_t keep = height + 1;
  const std::uint64_t new_size = entries_[keep].offset;
  if (!WriteMeta(keep, new_size, entries_[height].hash, error)) {
    return false;
  }
  // Meta is already committed; a failed truncate only leaves a tail that the
  // next append or Open() cuts off.
  std::string truncate_error;
  if (!TruncateFile(blocks_path_, new_size, &truncate_error)) {
    util::LogWarn("storage", truncate_error);
  }
  while (entries_.size() > keep) {
    heights_.erase(entries_.back().hash);
    entries_.pop_back();
    primitives::Hash256 removed{};
    if (!block_mmr_.RemoveLast(&removed)) {
      util::LogError("storage", "block MMR shorter than the index during rollback");
    }
  }
  committed_size_ = new_size;
  return true;
}

std::optional<std::uint64_t> ArchivalIndex::TipHeight() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.size() - 1;
}

std::optional<primitives::Hash256> ArchivalIndex::TipHash() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.back().hash;
}

std::optional<std::uint64_t> ArchivalIndex::HeightOf(const primitives::Hash256& hash) const {
  const auto it = heights_.find(hash);
  if (it == heights_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ArchivalIndex::GetHeader(std::uint64_t height, primitives::CBlockHeader* header) const {
  if (height >= entries_.size()) {
    return false;
  }
  if (header) *header = entries_[height].header;
  return true;
}

bool ArchivalIndex::GetBlockHash(std::uint64_t height, primitives::Hash256* hash) const {
  if (height >= entries_.size()) {
    return false;
  }
  if (hash) *hash = entries_[height].hash;
  return true;
}

bool ArchivalIndex::ReadRecord(std::uint64_t height, primitives::CBlock* block,
                               mutator_set::MutatorSetDelta* delta, std::string* error) const {
  if (height >= entries_.size()) {
    if (error) *error = "height " + std::to_string(height) + " not in archive";
    return false;
  }
  std::ifstream in(blocks_path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "failed to open blocks.dat";
    return false;
  }
  in.seekg(static_cast<std::streamoff>(entries_[height].offset), std::ios::beg);
  if (!in.good()) {
    if (error) *error = "failed to seek blocks.dat";
    return false;
  }
  std::vector<std::uint8_t> payload;
  std::string record_error;
  if (ReadNextRecord(&in, magic_, &payload, nullptr, &record_error) != RecordReadStatus::kOk) {
    if (error) {
      *error = "blocks.dat record " + std::to_string(height) + ": " +
               (record_error.empty() ? std::string("truncated") : record_error);
    }
    return false;
  }
  if (!DecodePayload(payload, block, delta)) {
    if (error) *error = "blocks.dat record " + std::to_string(height) + " malformed";
    return false;
  }
  return true;
}

bool ArchivalIndex::GetBlockByHeight(std::uint64_t height, primitives::CBlock* block,
                                     std::string* error) const {
  return ReadRecord(height, block, nullptr, error);
}

bool ArchivalIndex::GetBlockByHash(const primitives::Hash256& hash, primitives::CBlock* block,
                                   std::string* error) const {
  const auto height = HeightOf(hash);
  if (!height) {
    if (error) *error = "block not in archive";
    return false;
  }
  return ReadRecord(*height, block, nullptr, error);
}

bool ArchivalIndex::GetDelta(std::uint64_t height, mutator_set::MutatorSetDelta* delta,
                             std::string* error) const {
  return ReadRecord(height, nullptr, delta, error);
}

bool ArchivalIndex::ForEach(std::uint64_t from, std::uint64_t to, const Visitor& visitor,
                            std::string* error) const {
  if (entries_.empty() || from > to || from >= entries_.size()) {
    return true;
  }
  to = std::min<std::uint64_t>(to, entries_.size() - 1);
  std::ifstream in(blocks_path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "failed to open blocks.dat";
    return false;
  }
  in.seekg(static_cast<std::streamoff>(entries_[from].offset), std::ios::beg);
  std::vector<std::uint8_t> payload;
  for (std::uint64_t height = from; height <= to; ++height) {
    std::string record_error;
    if (ReadNextRecord(&in, magic_, &payload, nullptr, &record_error) != RecordReadStatus::kOk) {
      if (error) {
        *error = "blocks.dat record " + std::to_string(height) + ": " +
                 (record_error.empty() ? std::string("truncated") : record_error);
      }
      return false;
    }
    primitives::CBlock block;
    mutator_set::MutatorSetDelta delta;
    if (!DecodePayload(payload, &block, &delta)) {
      if (error) *error = "blocks.dat record " + std::to_string(height) + " malformed";
      return false;
    }
    if (!visitor(height, block, delta)) {
      break;
    }
  }
  return true;
}

bool ArchivalIndex::GetMmrProof(std::uint64_t height, mutator_set::MmrMembershipProof* proof,
                                std::string* error) const {
  if (!block_mmr_.Prove(height, proof)) {
    if (error) *error = "height " + std::to_string(height) + " not in block MMR";
    return false;
  }
  return true;
}

bool ArchivalIndex::VerifyMmrProof(const primitives::Hash256& block_hash,
                                   const mutator_set::MmrMembershipProof& proof,
                                   const std::vector<primitives::Hash256>& peaks,
                                   std::uint64_t leaf_count) {
  return proof.Verify(block_hash, peaks, leaf_count);
}

}  // namespace veil::storage
