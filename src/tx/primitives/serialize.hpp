#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "consensus/mutator_set/active_window.hpp"
#include "consensus/mutator_set/mutator_set_update.hpp"
#include "consensus/mutator_set/records.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace veil::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteHash(std::vector<std::uint8_t>* out, const Hash256& value);
void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadHash(const std::vector<std::uint8_t>& data, std::size_t* offset, Hash256* value);
bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes);

void SerializeChunk(const mutator_set::Chunk& chunk, std::vector<std::uint8_t>* out);
bool DeserializeChunk(const std::vector<std::uint8_t>& data, std::size_t* offset,
                      mutator_set::Chunk* chunk);
void SerializeActiveWindow(const mutator_set::ActiveWindow& window,
                           std::vector<std::uint8_t>* out);
bool DeserializeActiveWindow(const std::vector<std::uint8_t>& data, std::size_t* offset,
                             mutator_set::ActiveWindow* window);
void SerializeMmrProof(const mutator_set::MmrMembershipProof& proof,
                       std::vector<std::uint8_t>* out);
bool DeserializeMmrProof(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         mutator_set::MmrMembershipProof* proof);

// Removal records hash into the transaction id without their chunk
// dictionary, so refreshed records keep the same id.
void SerializeRemovalRecord(const mutator_set::RemovalRecord& record,
                            std::vector<std::uint8_t>* out, bool include_chunks = true);
bool DeserializeRemovalRecord(const std::vector<std::uint8_t>& data, std::size_t* offset,
                              mutator_set::RemovalRecord* record);
void SerializeMsMembershipProof(const mutator_set::MsMembershipProof& proof,
                                std::vector<std::uint8_t>* out);
bool DeserializeMsMembershipProof(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                  mutator_set::MsMembershipProof* proof);
void SerializeMutatorSetDelta(const mutator_set::MutatorSetDelta& delta,
                              std::vector<std::uint8_t>* out);
bool DeserializeMutatorSetDelta(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                mutator_set::MutatorSetDelta* delta);

void SerializeTransactionKernel(const CTransactionKernel& kernel, std::vector<std::uint8_t>* out,
                                bool include_chunks = true);
void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx);
std::size_t SerializedTransactionSize(const CTransaction& tx);
void SerializeBlockHeader(const CBlockHeader& header, std::vector<std::uint8_t>* out);
bool DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CBlockHeader* header);
void SerializeBlock(const CBlock& block, std::vector<std::uint8_t>* out);
bool DeserializeBlock(const std::vector<std::uint8_t>& data, std::size_t* offset, CBlock* block);
std::size_t SerializedBlockSize(const CBlock& block);

}  // namespace veil::primitives::serialize
