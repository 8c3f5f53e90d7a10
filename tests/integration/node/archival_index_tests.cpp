#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/params.hpp"
#include "storage/archival_index.hpp"
#include "unit/util/regtest_chain.hpp"

namespace {

using namespace veil;

struct Stored {
  primitives::CBlock block;
  mutator_set::MutatorSetDelta delta;
};

// Genesis plus `count` blocks with the deltas the chain manager would store.
std::vector<Stored> BuildHistory(test::RegtestChain* chain, std::size_t count) {
  std::vector<Stored> out;
  {
    mutator_set::ArchivalMutatorSet empty;
    Stored genesis{chain->Tip(), {}};
    std::string error;
    consensus::BlockMutatorSetUpdate(genesis.block).Apply(&empty, &genesis.delta, &error);
    if (chain->TipHeight() == 0) {
      out.push_back(std::move(genesis));
    }
  }
  for (std::size_t i = 0; i < count; ++i) {
    auto block = chain->NextBlock();
    auto working = chain->Set();
    Stored stored{block, {}};
    std::string error;
    consensus::BlockMutatorSetUpdate(block).Apply(&working, &stored.delta, &error);
    chain->Append(block, &error);
    out.push_back(std::move(stored));
  }
  return out;
}

std::unique_ptr<storage::ArchivalIndex> OpenIndex(const std::filesystem::path& dir,
                                                  std::uint32_t magic) {
  std::string error;
  auto index = storage::ArchivalIndex::Open(dir, magic, &error);
  if (!index) {
    std::cerr << "archival_index_tests: open failed: " << error << "\n";
  }
  return index;
}

bool AppendAll(storage::ArchivalIndex* index, const std::vector<Stored>& history) {
  for (const auto& stored : history) {
    std::string error;
    if (!index->AppendBlock(stored.block, stored.delta, &error)) {
      std::cerr << "archival_index_tests: append failed: " << error << "\n";
      return false;
    }
  }
  return true;
}

bool TestAppendAndLookup(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_lookup");
  test::RegtestChain chain(params);
  const auto history = BuildHistory(&chain, 4);
  auto index = OpenIndex(dir, magic);
  if (!index || !index->Empty() || index->TipHeight().has_value()) {
    std::cerr << "archival_index_tests: fresh index not empty\n";
    return false;
  }
  if (!AppendAll(index.get(), history)) {
    return false;
  }
  if (index->BlockCount() != 5 || index->TipHeight() != 4 ||
      index->TipHash() != consensus::ComputeBlockHash(history.back().block.header)) {
    std::cerr << "archival_index_tests: tip mismatch after appends\n";
    return false;
  }
  std::string error;
  primitives::CBlock block;
  if (!index->GetBlockByHeight(2, &block, &error) || !(block == history[2].block)) {
    std::cerr << "archival_index_tests: block by height mismatch " << error << "\n";
    return false;
  }
  const auto hash3 = consensus::ComputeBlockHash(history[3].block.header);
  if (index->HeightOf(hash3) != 3 || !index->GetBlockByHash(hash3, &block, &error) ||
      !(block == history[3].block)) {
    std::cerr << "archival_index_tests: block by hash mismatch\n";
    return false;
  }
  mutator_set::MutatorSetDelta delta;
  if (!index->GetDelta(4, &delta, &error) || !(delta == history[4].delta)) {
    std::cerr << "archival_index_tests: delta mismatch\n";
    return false;
  }
  if (index->GetBlockByHeight(5, &block, &error)) {
    std::cerr << "archival_index_tests: read past the tip succeeded\n";
    return false;
  }

  std::vector<std::uint64_t> visited;
  if (!index->ForEach(1, 3,
                      [&](std::uint64_t height, const primitives::CBlock& b,
                          const mutator_set::MutatorSetDelta&) {
                        visited.push_back(height);
                        return b.header.height == height;
                      },
                      &error) ||
      visited != std::vector<std::uint64_t>{1, 2, 3}) {
    std::cerr << "archival_index_tests: range iteration mismatch\n";
    return false;
  }
  visited.clear();
  index->ForEach(0, 4,
                 [&](std::uint64_t height, const primitives::CBlock&,
                     const mutator_set::MutatorSetDelta&) {
                   visited.push_back(height);
                   return height < 1;
                 },
                 &error);
  if (visited.size() != 2) {
    std::cerr << "archival_index_tests: visitor stop ignored\n";
    return false;
  }
  return true;
}

bool TestMmrProofs(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_mmr");
  test::RegtestChain chain(params);
  const auto history = BuildHistory(&chain, 6);
  auto index = OpenIndex(dir, magic);
  if (!index || !AppendAll(index.get(), history)) {
    return false;
  }
  const auto peaks = index->MmrPeaks();
  for (std::uint64_t height = 0; height < history.size(); ++height) {
    mutator_set::MmrMembershipProof proof;
    std::string error;
    if (!index->GetMmrProof(height, &proof, &error)) {
      std::cerr << "archival_index_tests: no proof at " << height << ": " << error << "\n";
      return false;
    }
    const auto hash = consensus::ComputeBlockHash(history[height].block.header);
    if (!storage::ArchivalIndex::VerifyMmrProof(hash, proof, peaks, index->MmrLeafCount())) {
      std::cerr << "archival_index_tests: proof at " << height << " does not verify\n";
      return false;
    }
    const auto other = consensus::ComputeBlockHash(history[(height + 1) % history.size()].block.header);
    if (storage::ArchivalIndex::VerifyMmrProof(other, proof, peaks, index->MmrLeafCount())) {
      std::cerr << "archival_index_tests: proof verified for the wrong block\n";
      return false;
    }
  }
  return true;
}

bool TestRollbackAndReopen(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_rollback");
  test::RegtestChain chain(params);
  auto history = BuildHistory(&chain, 2);
  test::RegtestChain fork = chain.Fork("fork");
  const auto main_tail = BuildHistory(&chain, 2);
  history.insert(history.end(), main_tail.begin(), main_tail.end());

  auto index = OpenIndex(dir, magic);
  if (!index || !AppendAll(index.get(), history)) {
    return false;
  }
  const auto peaks_at_two = [&] {
    auto shorter = OpenIndex(test::FreshTempDir("veil_archival_index_prefix"), magic);
    std::vector<Stored> prefix(history.begin(), history.begin() + 3);
    AppendAll(shorter.get(), prefix);
    return shorter->MmrPeaks();
  }();

  std::string error;
  if (!index->RollbackTo(2, &error)) {
    std::cerr << "archival_index_tests: rollback failed: " << error << "\n";
    return false;
  }
  const auto dropped = consensus::ComputeBlockHash(history[3].block.header);
  if (index->BlockCount() != 3 || index->HeightOf(dropped).has_value() ||
      index->MmrPeaks() != peaks_at_two) {
    std::cerr << "archival_index_tests: rollback left stale state\n";
    return false;
  }

  const auto fork_tail = BuildHistory(&fork, 3);
  if (!AppendAll(index.get(), fork_tail)) {
    return false;
  }
  const auto expected_tip = consensus::ComputeBlockHash(fork_tail.back().block.header);
  const auto expected_peaks = index->MmrPeaks();
  index.reset();

  auto reopened = OpenIndex(dir, magic);
  if (!reopened || reopened->BlockCount() != 6 || reopened->TipHash() != expected_tip ||
      reopened->MmrPeaks() != expected_peaks) {
    std::cerr << "archival_index_tests: reopen did not restore the fork\n";
    return false;
  }
  primitives::CBlock block;
  if (!reopened->GetBlockByHeight(4, &block, &error) || !(block == fork_tail[1].block)) {
    std::cerr << "archival_index_tests: fork block unreadable after reopen\n";
    return false;
  }
  return true;
}

bool TestTornTail(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_torn");
  test::RegtestChain chain(params);
  const auto history = BuildHistory(&chain, 3);
  const auto extra = BuildHistory(&chain, 1);
  {
    auto index = OpenIndex(dir, magic);
    if (!index || !AppendAll(index.get(), history)) {
      return false;
    }
  }
  const auto blocks_path = dir / "blocks.dat";
  const auto committed = std::filesystem::file_size(blocks_path);
  {
    std::ofstream out(blocks_path, std::ios::binary | std::ios::app);
    const char garbage[] = "half a record";
    out.write(garbage, sizeof(garbage));
  }
  auto index = OpenIndex(dir, magic);
  if (!index || index->BlockCount() != history.size()) {
    std::cerr << "archival_index_tests: torn tail broke reopen\n";
    return false;
  }
  if (std::filesystem::file_size(blocks_path) != committed) {
    std::cerr << "archival_index_tests: torn tail not truncated\n";
    return false;
  }
  if (!AppendAll(index.get(), extra) || index->TipHeight() != 4) {
    std::cerr << "archival_index_tests: append after torn tail failed\n";
    return false;
  }
  return true;
}

bool TestLostCommittedRecords(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_lost");
  test::RegtestChain chain(params);
  const auto history = BuildHistory(&chain, 3);
  std::uint64_t intact_size = 0;
  {
    auto index = OpenIndex(dir, magic);
    if (!index || !AppendAll(index.get(), {history.begin(), history.end() - 1})) {
      return false;
    }
    intact_size = std::filesystem::file_size(dir / "blocks.dat");
    if (!AppendAll(index.get(), {history.back()})) {
      return false;
    }
  }
  // index.meta counts the last record but only part of it reached the disk.
  const auto blocks_path = dir / "blocks.dat";
  std::filesystem::resize_file(blocks_path, std::filesystem::file_size(blocks_path) - 7);

  auto index = OpenIndex(dir, magic);
  const auto kept_tip = consensus::ComputeBlockHash(history[history.size() - 2].block.header);
  if (!index || index->BlockCount() != history.size() - 1 || index->TipHash() != kept_tip) {
    std::cerr << "archival_index_tests: lost record not trimmed on reopen\n";
    return false;
  }
  if (std::filesystem::file_size(blocks_path) != intact_size) {
    std::cerr << "archival_index_tests: damaged record left in blocks.dat\n";
    return false;
  }
  if (!AppendAll(index.get(), {history.back()}) || index->TipHeight() != history.size() - 1) {
    std::cerr << "archival_index_tests: append after trimming failed\n";
    return false;
  }
  index.reset();
  index = OpenIndex(dir, magic);
  if (!index || index->BlockCount() != history.size()) {
    std::cerr << "archival_index_tests: re-appended record lost on reopen\n";
    return false;
  }
  index.reset();

  std::filesystem::remove(blocks_path);
  index = OpenIndex(dir, magic);
  if (!index || !index->Empty()) {
    std::cerr << "archival_index_tests: missing blocks.dat not treated as empty\n";
    return false;
  }
  index.reset();
  index = OpenIndex(dir, magic);
  if (!index || !index->Empty()) {
    std::cerr << "archival_index_tests: trimmed meta not committed\n";
    return false;
  }
  return true;
}

bool TestRejectsForeignOrCorruptFiles(std::uint32_t magic, const consensus::ChainParams& params) {
  const auto dir = test::FreshTempDir("veil_archival_index_corrupt");
  test::RegtestChain chain(params);
  const auto history = BuildHistory(&chain, 1);
  {
    auto index = OpenIndex(dir, magic);
    if (!index || !AppendAll(index.get(), history)) {
      return false;
    }
  }
  std::string error;
  if (storage::ArchivalIndex::Open(dir, magic ^ 0x01010101u, &error)) {
    std::cerr << "archival_index_tests: foreign network index opened\n";
    return false;
  }
  {
    std::fstream meta(dir / "index.meta", std::ios::binary | std::ios::in | std::ios::out);
    meta.seekp(14);
    meta.put('\x7f');
  }
  error.clear();
  if (storage::ArchivalIndex::Open(dir, magic, &error) || error.empty()) {
    std::cerr << "archival_index_tests: corrupt meta accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const auto& params = consensus::Params(config::NetworkType::kRegtest);
  const auto magic = config::GetNetworkConfig(config::NetworkType::kRegtest).storage_magic;
  bool ok = true;
  ok &= TestAppendAndLookup(magic, params);
  ok &= TestMmrProofs(magic, params);
  ok &= TestRollbackAndReopen(magic, params);
  ok &= TestTornTail(magic, params);
  ok &= TestLostCommittedRecords(magic, params);
  ok &= TestRejectsForeignOrCorruptFiles(magic, params);
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "archival_index_tests: OK\n";
  return EXIT_SUCCESS;
}
