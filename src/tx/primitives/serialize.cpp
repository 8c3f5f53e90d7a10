#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace veil::primitives::serialize {

namespace {

constexpr std::uint64_t kMaxAuthPathLength = 64;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

// Reads a element count and rejects counts the remaining bytes cannot hold.
bool ReadCount(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::size_t min_element_size, std::size_t* count) {
  std::uint64_t value = 0;
  if (!ReadVarInt(data, offset, &value)) return false;
  const std::size_t remaining = data.size() - *offset;
  if (min_element_size > 0 && value > remaining / min_element_size) {
    return false;
  }
  *count = static_cast<std::size_t>(value);
  return true;
}

void SerializeChunkDictionary(const mutator_set::ChunkDictionary& chunks,
                              std::vector<std::uint8_t>* out) {
  WriteVarInt(out, chunks.size());
  for (const auto& [chunk_index, entry] : chunks) {
    WriteUint64(out, chunk_index);
    SerializeMmrProof(entry.proof, out);
    SerializeChunk(entry.chunk, out);
  }
}

bool DeserializeChunkDictionary(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                mutator_set::ChunkDictionary* chunks) {
  std::size_t count = 0;
  if (!ReadCount(data, offset, 18, &count)) return false;
  chunks->clear();
  bool first = true;
  std::uint64_t previous = 0;
  for (std::size_t i = 0; i < count; ++i) {
    std::uint64_t chunk_index = 0;
    mutator_set::ChunkEntry entry;
    if (!ReadUint64(data, offset, &chunk_index)) return false;
    if (!first && chunk_index <= previous) return false;
    if (!DeserializeMmrProof(data, offset, &entry.proof)) return false;
    if (!DeserializeChunk(data, offset, &entry.chunk)) return false;
    chunks->emplace(chunk_index, std::move(entry));
    previous = chunk_index;
    first = false;
  }
  return true;
}

bool ReadSortedIndices(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       std::uint64_t bound, std::vector<std::uint32_t>* out) {
  std::size_t count = 0;
  if (!ReadCount(data, offset, 4, &count)) return false;
  out->clear();
  out->reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    std::uint32_t index = 0;
    if (!ReadUint32(data, offset, &index)) return false;
    if (index >= bound) return false;
    if (!out->empty() && index <= out->back()) return false;
    out->push_back(index);
  }
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteHash(std::vector<std::uint8_t>* out, const Hash256& value) {
  out->insert(out->end(), value.begin(), value.end());
}

void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  WriteVarInt(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (v16 < 0xFD) {
      return false;
    }
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) {
      return false;
    }
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) {
    return false;
  }
  *value = tmp;
  return true;
}

bool ReadHash(const std::vector<std::uint8_t>& data, std::size_t* offset, Hash256* value) {
  if (!Require(data, *offset, value->size())) return false;
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), value->size(),
              value->begin());
  *offset += value->size();
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes) {
  std::size_t size = 0;
  if (!ReadCount(data, offset, 1, &size)) return false;
  bytes->assign(data.begin() + static_cast<std::ptrdiff_t>(*offset),
                data.begin() + static_cast<std::ptrdiff_t>(*offset + size));
  *offset += size;
  return true;
}

void SerializeChunk(const mutator_set::Chunk& chunk, std::vector<std::uint8_t>* out) {
  WriteVarInt(out, chunk.relative_indices.size());
  for (auto index : chunk.relative_indices) {
    WriteUint32(out, index);
  }
}

bool DeserializeChunk(const std::vector<std::uint8_t>& data, std::size_t* offset,
                      mutator_set::Chunk* chunk) {
  return ReadSortedIndices(data, offset, mutator_set::kChunkSize, &chunk->relative_indices);
}

void SerializeActiveWindow(const mutator_set::ActiveWindow& window,
                           std::vector<std::uint8_t>* out) {
  const auto& indices = window.RelativeIndices();
  WriteVarInt(out, indices.size());
  for (auto index : indices) {
    WriteUint32(out, index);
  }
}

bool DeserializeActiveWindow(const std::vector<std::uint8_t>& data, std::size_t* offset,
                             mutator_set::ActiveWindow* window) {
  std::vector<std::uint32_t> indices;
  if (!ReadSortedIndices(data, offset, mutator_set::kWindowSize, &indices)) return false;
  *window = mutator_set::ActiveWindow(std::move(indices));
  return true;
}

void SerializeMmrProof(const mutator_set::MmrMembershipProof& proof,
                       std::vector<std::uint8_t>* out) {
  WriteUint64(out, proof.leaf_index);
  WriteVarInt(out, proof.authentication_path.size());
  for (const auto& node : proof.authentication_path) {
    WriteHash(out, node);
  }
}

bool DeserializeMmrProof(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         mutator_set::MmrMembershipProof* proof) {
  if (!ReadUint64(data, offset, &proof->leaf_index)) return false;
  std::size_t length = 0;
  if (!ReadCount(data, offset, 32, &length) || length > kMaxAuthPathLength) return false;
  proof->authentication_path.resize(length);
  for (auto& node : proof->authentication_path) {
    if (!ReadHash(data, offset, &node)) return false;
  }
  return true;
}

void SerializeRemovalRecord(const mutator_set::RemovalRecord& record,
                            std::vector<std::uint8_t>* out, bool include_chunks) {
  for (auto index : record.absolute_indices) {
    WriteUint64(out, index);
  }
  if (include_chunks) {
    SerializeChunkDictionary(record.target_chunks, out);
  }
}

bool DeserializeRemovalRecord(const std::vector<std::uint8_t>& data, std::size_t* offset,
                              mutator_set::RemovalRecord* record) {
  for (auto& index : record->absolute_indices) {
    if (!ReadUint64(data, offset, &index)) return false;
  }
  return DeserializeChunkDictionary(data, offset, &record->target_chunks);
}

void SerializeMsMembershipProof(const mutator_set::MsMembershipProof& proof,
                                std::vector<std::uint8_t>* out) {
  WriteHash(out, proof.sender_randomness);
  WriteHash(out, proof.receiver_preimage);
  SerializeMmrProof(proof.auth_path_aocl, out);
  SerializeChunkDictionary(proof.target_chunks, out);
}

bool DeserializeMsMembershipProof(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                  mutator_set::MsMembershipProof* proof) {
  if (!ReadHash(data, offset, &proof->sender_randomness)) return false;
  if (!ReadHash(data, offset, &proof->receiver_preimage)) return false;
  if (!DeserializeMmrProof(data, offset, &proof->auth_path_aocl)) return false;
  return DeserializeChunkDictionary(data, offset, &proof->target_chunks);
}

void SerializeMutatorSetDelta(const mutator_set::MutatorSetDelta& delta,
                              std::vector<std::uint8_t>* out) {
  WriteUint64(out, delta.additions);
  WriteVarInt(out, delta.flipped_indices.size());
  for (auto index : delta.flipped_indices) {
    WriteUint64(out, index);
  }
}

bool DeserializeMutatorSetDelta(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                mutator_set::MutatorSetDelta* delta) {
  if (!ReadUint64(data, offset, &delta->additions)) return false;
  std::size_t count = 0;
  if (!ReadCount(data, offset, 8, &count)) return false;
  delta->flipped_indices.resize(count);
  for (auto& index : delta->flipped_indices) {
    if (!ReadUint64(data, offset, &index)) return false;
  }
  return true;
}

void SerializeTransactionKernel(const CTransactionKernel& kernel, std::vector<std::uint8_t>* out,
                                bool include_chunks) {
  WriteVarInt(out, kernel.inputs.size());
  for (const auto& input : kernel.inputs) {
    SerializeRemovalRecord(input, out, include_chunks);
  }
  WriteVarInt(out, kernel.outputs.size());
  for (const auto& output : kernel.outputs) {
    WriteHash(out, output.canonical_commitment);
  }
  WriteUint64(out, kernel.fee);
  WriteUint64(out, kernel.coinbase);
  WriteUint64(out, kernel.timestamp);
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  SerializeTransactionKernel(tx.kernel, out, /*include_chunks=*/true);
  WriteBytes(out, tx.proof);
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx) {
  std::size_t input_count = 0;
  if (!ReadCount(data, offset, mutator_set::kNumTrials * 8, &input_count)) return false;
  tx->kernel.inputs.resize(input_count);
  for (auto& input : tx->kernel.inputs) {
    if (!DeserializeRemovalRecord(data, offset, &input)) return false;
  }
  std::size_t output_count = 0;
  if (!ReadCount(data, offset, 32, &output_count)) return false;
  tx->kernel.outputs.resize(output_count);
  for (auto& output : tx->kernel.outputs) {
    if (!ReadHash(data, offset, &output.canonical_commitment)) return false;
  }
  if (!ReadUint64(data, offset, &tx->kernel.fee)) return false;
  if (!ReadUint64(data, offset, &tx->kernel.coinbase)) return false;
  if (!ReadUint64(data, offset, &tx->kernel.timestamp)) return false;
  return ReadBytes(data, offset, &tx->proof);
}

std::size_t SerializedTransactionSize(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  SerializeTransaction(tx, &buffer);
  return buffer.size();
}

void SerializeBlockHeader(const CBlockHeader& header, std::vector<std::uint8_t>* out) {
  WriteUint32(out, header.version);
  WriteHash(out, header.previous_block_hash);
  WriteUint64(out, header.height);
  WriteUint64(out, header.timestamp);
  WriteUint32(out, header.difficulty_bits);
  WriteUint64(out, header.nonce);
  WriteHash(out, header.body_root);
  WriteHash(out, header.mutator_set_root);
  out->insert(out->end(), header.cumulative_work.begin(), header.cumulative_work.end());
}

bool DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CBlockHeader* header) {
  if (!ReadUint32(data, offset, &header->version)) return false;
  if (!ReadHash(data, offset, &header->previous_block_hash)) return false;
  if (!ReadUint64(data, offset, &header->height)) return false;
  if (!ReadUint64(data, offset, &header->timestamp)) return false;
  if (!ReadUint32(data, offset, &header->difficulty_bits)) return false;
  if (!ReadUint64(data, offset, &header->nonce)) return false;
  if (!ReadHash(data, offset, &header->body_root)) return false;
  if (!ReadHash(data, offset, &header->mutator_set_root)) return false;
  return ReadHash(data, offset, &header->cumulative_work);
}

void SerializeBlock(const CBlock& block, std::vector<std::uint8_t>* out) {
  SerializeBlockHeader(block.header, out);
  WriteVarInt(out, block.transactions.size());
  for (const auto& tx : block.transactions) {
    SerializeTransaction(tx, out);
  }
  WriteBytes(out, block.proof);
}

bool DeserializeBlock(const std::vector<std::uint8_t>& data, std::size_t* offset, CBlock* block) {
  if (!DeserializeBlockHeader(data, offset, &block->header)) return false;
  std::size_t tx_count = 0;
  if (!ReadCount(data, offset, 28, &tx_count)) return false;
  block->transactions.resize(tx_count);
  for (auto& tx : block->transactions) {
    if (!DeserializeTransaction(data, offset, &tx)) return false;
  }
  return ReadBytes(data, offset, &block->proof);
}

std::size_t SerializedBlockSize(const CBlock& block) {
  std::vector<std::uint8_t> buffer;
  SerializeBlock(block, &buffer);
  return buffer.size();
}

}  // namespace veil::primitives::serialize
