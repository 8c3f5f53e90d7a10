#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/network.hpp"
#include "config/node_options.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/mutator_set/shared.hpp"
#include "consensus/params.hpp"
#include "crypto/proof_system.hpp"
#include "node/node_core.hpp"
#include "primitives/txid.hpp"
#include "storage/archival_index.hpp"
#include "unit/util/regtest_chain.hpp"

namespace {

using namespace veil;

constexpr std::uint64_t kFarFuture = 4'000'000'000ULL;

const consensus::ChainParams& Regtest() { return consensus::Params(config::NetworkType::kRegtest); }

class SlowVerifier final : public crypto::ProofVerifier {
 public:
  crypto::ProofVerdict Verify(const crypto::ProofStatement&,
                              std::span<const std::uint8_t>) const override {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return crypto::ProofVerdict::kValid;
  }
};

node::NodeCoreOptions Options(const std::string& name) {
  node::NodeCoreOptions options;
  options.data_dir = test::FreshTempDir(name);
  options.clock = [] { return kFarFuture; };
  return options;
}

bool ExpectReject(const char* what, bool ok, const consensus::ValidationState& state,
                  consensus::RejectReason expected) {
  if (ok) {
    std::cerr << "node_core_tests: " << what << " unexpectedly accepted\n";
    return false;
  }
  if (state.reason != expected) {
    std::cerr << "node_core_tests: " << what << " rejected as " << state.ToString() << "\n";
    return false;
  }
  return true;
}

bool TestQueriesAndBlockProofs() {
  node::NodeCore core(Regtest(), Options("veil_node_core_queries"),
                      std::make_shared<crypto::HashCommitmentProofSystem>());
  std::string error;
  if (!core.Initialize(&error)) {
    std::cerr << "node_core_tests: init failed: " << error << "\n";
    return false;
  }
  std::vector<node::BlockNotification> seen;
  core.RegisterBlockListener(
      [&seen](const node::BlockNotification& notification) { seen.push_back(notification); });

  test::RegtestChain chain(Regtest());
  std::vector<primitives::CBlock> blocks;
  consensus::ValidationState state;
  for (int i = 0; i < 5; ++i) {
    blocks.push_back(chain.Extend());
    if (!core.SubmitBlock(blocks.back(), &state)) {
      std::cerr << "node_core_tests: block rejected: " << state.ToString() << "\n";
      return false;
    }
  }
  const auto tip = core.GetTip();
  if (!tip || tip->height != 5 || tip->hash != chain.TipHash() ||
      !(tip->header == chain.Tip().header) || core.GetAccumulatorRoot() != chain.Set().Hash()) {
    std::cerr << "node_core_tests: tip queries disagree with the submitted chain\n";
    return false;
  }
  if (seen.size() != 5 || !seen.back().connected || seen.back().hash != chain.TipHash()) {
    std::cerr << "node_core_tests: listener saw " << seen.size() << " notifications\n";
    return false;
  }

  const auto hash2 = consensus::ComputeBlockHash(blocks[1].header);
  node::BlockMmrProof proof;
  if (!core.GetBlockProof(hash2, &proof, &error) ||
      !storage::ArchivalIndex::VerifyMmrProof(hash2, proof.proof, proof.peaks, proof.leaf_count)) {
    std::cerr << "node_core_tests: block MMR proof does not verify: " << error << "\n";
    return false;
  }
  primitives::CBlock fetched;
  if (!core.GetBlock(hash2, &fetched, &error) || !(fetched == blocks[1])) {
    std::cerr << "node_core_tests: block lookup mismatch\n";
    return false;
  }
  if (core.GetBlockProof(primitives::Hash256{}, &proof, &error)) {
    std::cerr << "node_core_tests: proof produced for an unknown block\n";
    return false;
  }

  state = {};
  if (!ExpectReject("resubmitted block", core.SubmitBlock(blocks[2], &state), state,
                    consensus::RejectReason::kAlreadyKnown)) {
    return false;
  }
  auto orphan = chain.NextBlock();
  orphan.header.previous_block_hash[0] ^= 0xFF;
  test::RegtestChain::Mine(&orphan.header);
  state = {};
  if (!ExpectReject("orphan block", core.SubmitBlock(orphan, &state), state,
                    consensus::RejectReason::kUnknownPredecessor)) {
    return false;
  }
  if (core.Chain().GetTelemetry().orphan_blocks != 1) {
    std::cerr << "node_core_tests: orphan not counted\n";
    return false;
  }
  return true;
}

bool TestTransactionSubmission() {
  node::NodeCore core(Regtest(), Options("veil_node_core_tx"),
                      std::make_shared<crypto::HashCommitmentProofSystem>());
  std::string error;
  if (!core.Initialize(&error)) {
    std::cerr << "node_core_tests: init failed: " << error << "\n";
    return false;
  }
  test::RegtestChain chain(Regtest());
  consensus::ValidationState state;
  for (int i = 0; i < 3; ++i) {
    if (!core.SubmitBlock(chain.Extend(), &state)) {
      std::cerr << "node_core_tests: block rejected: " << state.ToString() << "\n";
      return false;
    }
  }
  const auto coins = chain.Coins();

  auto forged = chain.Spend(coins[0], 1'000);
  forged.proof[0] ^= 0x01;
  state = {};
  if (!ExpectReject("forged proof", core.SubmitTransaction(forged, &state), state,
                    consensus::RejectReason::kProofInvalid)) {
    return false;
  }
  if (core.Pool().Size() != 0) {
    std::cerr << "node_core_tests: rejected transaction reached the mempool\n";
    return false;
  }

  const auto mined = chain.Spend(coins[0], 1'000);
  const auto pending = chain.Spend(coins[1], 2'000);
  state = {};
  if (!core.SubmitTransaction(mined, &state) || !core.SubmitTransaction(pending, &state)) {
    std::cerr << "node_core_tests: valid transaction rejected: " << state.ToString() << "\n";
    return false;
  }
  state = {};
  if (!ExpectReject("duplicate transaction", core.SubmitTransaction(mined, &state), state,
                    consensus::RejectReason::kAlreadyKnown)) {
    return false;
  }
  const auto snapshot = core.GetMempoolSnapshot();
  if (snapshot.size() != 2 || snapshot.front().txid != primitives::ComputeTxId(pending)) {
    std::cerr << "node_core_tests: mempool snapshot not ordered by feerate\n";
    return false;
  }

  state = {};
  if (!core.SubmitBlock(chain.Extend({mined}), &state)) {
    std::cerr << "node_core_tests: block with mempool tx rejected: " << state.ToString() << "\n";
    return false;
  }
  if (core.Pool().Contains(primitives::ComputeTxId(mined)) ||
      !core.Pool().Contains(primitives::ComputeTxId(pending))) {
    std::cerr << "node_core_tests: mempool not synchronized with the new block\n";
    return false;
  }
  // The pending entry was carried across the block and can still be mined.
  const auto carried = core.GetMempoolSnapshot().front().tx;
  state = {};
  if (!core.SubmitBlock(chain.Extend({carried}), &state) || core.Pool().Size() != 0) {
    std::cerr << "node_core_tests: carried-forward transaction not mineable: "
              << state.ToString() << "\n";
    return false;
  }
  return true;
}

bool TestProofDeadline() {
  auto options = Options("veil_node_core_deadline");
  options.proof_deadline = std::chrono::milliseconds(20);
  node::NodeCore core(Regtest(), options, std::make_shared<SlowVerifier>());
  std::string error;
  if (!core.Initialize(&error)) {
    std::cerr << "node_core_tests: init failed: " << error << "\n";
    return false;
  }
  test::RegtestChain chain(Regtest());
  consensus::ValidationState state;
  if (!ExpectReject("slow block proof", core.SubmitBlock(chain.NextBlock(), &state), state,
                    consensus::RejectReason::kUnverified)) {
    return false;
  }
  if (core.GetTip()->height != 0) {
    std::cerr << "node_core_tests: unverified block changed the tip\n";
    return false;
  }
  return true;
}

// Two sibling blocks race each other, transaction submissions and tip
// readers. The result must match applying the same inputs one at a time.
bool TestConcurrentSubmissionMatchesSerialReplay(int round) {
  const std::string label = "race-" + std::to_string(round);
  test::RegtestChain chain(Regtest(), label + "-main");
  std::vector<primitives::CBlock> prefix;
  // Siblings must not slide the window, so the pending records stay valid
  // whichever sibling wins.
  while (prefix.size() < 5 || mutator_set::WindowSlides(chain.Set().AoclLeafCount())) {
    prefix.push_back(chain.Extend());
  }
  auto side = chain.Fork(label + "-side");
  const auto sibling_a = chain.NextBlock();
  const auto sibling_b = side.NextBlock();
  std::vector<primitives::CTransaction> txs;
  for (std::size_t i = 0; i < 4; ++i) {
    txs.push_back(chain.Spend(chain.Coins()[i], 1'000 * (i + 1)));
  }

  struct Observed {
    primitives::Hash256 tip;
    primitives::Hash256 root;
  };
  auto apply = [](const primitives::CBlock& block, mutator_set::ArchivalMutatorSet set) {
    mutator_set::MutatorSetDelta delta;
    std::string error;
    consensus::BlockMutatorSetUpdate(block).Apply(&set, &delta, &error);
    return Observed{consensus::ComputeBlockHash(block.header), set.Hash()};
  };
  const std::vector<Observed> allowed = {{chain.TipHash(), chain.Set().Hash()},
                                         apply(sibling_a, chain.Set()),
                                         apply(sibling_b, chain.Set())};

  auto serial_options = Options("veil_node_core_serial_" + std::to_string(round));
  node::NodeCore serial(Regtest(), serial_options,
                        std::make_shared<crypto::HashCommitmentProofSystem>());
  node::NodeCore racing(Regtest(), Options("veil_node_core_racing_" + std::to_string(round)),
                        std::make_shared<crypto::HashCommitmentProofSystem>());
  std::string error;
  if (!serial.Initialize(&error) || !racing.Initialize(&error)) {
    std::cerr << "node_core_tests: init failed: " << error << "\n";
    return false;
  }
  consensus::ValidationState state;
  for (const auto& block : prefix) {
    if (!serial.SubmitBlock(block, &state) || !racing.SubmitBlock(block, &state)) {
      std::cerr << "node_core_tests: prefix block rejected: " << state.ToString() << "\n";
      return false;
    }
  }
  for (const auto* block : {&sibling_a, &sibling_b}) {
    if (!serial.SubmitBlock(*block, &state)) {
      std::cerr << "node_core_tests: serial sibling rejected: " << state.ToString() << "\n";
      return false;
    }
  }
  for (const auto& tx : txs) {
    if (!serial.SubmitTransaction(tx, &state)) {
      std::cerr << "node_core_tests: serial transaction rejected: " << state.ToString() << "\n";
      return false;
    }
  }

  std::atomic<bool> go{false};
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};
  auto wait_for_go = [&go] {
    while (!go.load(std::memory_order_acquire)) {
      std::this_thread::yield();
    }
  };
  auto submit_block = [&](const primitives::CBlock& block) {
    wait_for_go();
    consensus::ValidationState block_state;
    if (!racing.SubmitBlock(block, &block_state)) {
      std::cerr << "node_core_tests: racing sibling rejected: " << block_state.ToString() << "\n";
      failures.fetch_add(1);
    }
  };
  std::vector<std::thread> threads;
  threads.emplace_back(submit_block, std::cref(sibling_a));
  threads.emplace_back(submit_block, std::cref(sibling_b));
  threads.emplace_back([&] {
    wait_for_go();
    for (const auto& tx : txs) {
      consensus::ValidationState tx_state;
      if (!racing.SubmitTransaction(tx, &tx_state)) {
        std::cerr << "node_core_tests: racing transaction rejected: " << tx_state.ToString()
                  << "\n";
        failures.fetch_add(1);
      }
    }
  });
  threads.emplace_back([&] {
    wait_for_go();
    while (!done.load(std::memory_order_acquire)) {
      const auto tip = racing.Chain().CurrentTip();
      const bool consistent =
          std::any_of(allowed.begin(), allowed.end(), [&](const Observed& seen) {
            return seen.tip == tip.hash && seen.root == tip.accumulator.Hash();
          });
      if (!consistent) {
        std::cerr << "node_core_tests: reader saw a tip and accumulator that never coexisted\n";
        failures.fetch_add(1);
        return;
      }
    }
  });
  go.store(true, std::memory_order_release);
  for (std::size_t i = 0; i < 3; ++i) {
    threads[i].join();
  }
  done.store(true, std::memory_order_release);
  threads[3].join();
  if (failures.load() != 0) {
    return false;
  }

  const auto expected_tip = std::min(allowed[1].tip, allowed[2].tip);
  if (racing.GetTip()->hash != expected_tip || serial.GetTip()->hash != expected_tip ||
      racing.GetAccumulatorRoot() != serial.GetAccumulatorRoot()) {
    std::cerr << "node_core_tests: racing tip differs from the serial replay\n";
    return false;
  }
  auto txids = [](const std::vector<node::MempoolEntry>& entries) {
    std::vector<primitives::Hash256> out;
    for (const auto& entry : entries) {
      out.push_back(entry.txid);
    }
    return out;
  };
  const auto racing_pool = txids(racing.GetMempoolSnapshot());
  if (racing_pool != txids(serial.GetMempoolSnapshot()) || racing_pool.size() != txs.size()) {
    std::cerr << "node_core_tests: racing mempool differs from the serial replay\n";
    return false;
  }
  // Every pending entry is still valid at the shared tip.
  const auto next = racing.GetMempoolSnapshot();
  auto winner = allowed[1].tip == expected_tip ? chain : side;
  std::string append_error;
  if (!winner.Append(allowed[1].tip == expected_tip ? sibling_a : sibling_b, &append_error)) {
    std::cerr << "node_core_tests: builder could not follow the winner: " << append_error << "\n";
    return false;
  }
  std::vector<primitives::CTransaction> pending;
  for (const auto& entry : next) {
    pending.push_back(entry.tx);
  }
  state = {};
  if (!racing.SubmitBlock(winner.NextBlock(pending), &state) || racing.Pool().Size() != 0) {
    std::cerr << "node_core_tests: pending entries not minable after the race: "
              << state.ToString() << "\n";
    return false;
  }
  return true;
}

bool TestOptionsFromConfig() {
  config::NodeOptions opts;
  opts.data_dir = "/tmp/veil-node-core";
  opts.max_reorg_depth = 12;
  opts.mempool_max_bytes = 4096;
  opts.mempool_max_count = 7;
  opts.proof_deadline_ms = 0;
  const auto options = node::NodeCoreOptionsFrom(opts);
  if (options.data_dir != "/tmp/veil-node-core" || options.max_reorg_depth != 12 ||
      options.mempool_max_bytes != 4096 || options.mempool_max_count != 7 ||
      options.proof_deadline.count() != 0) {
    std::cerr << "node_core_tests: options not carried over\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestQueriesAndBlockProofs();
  ok &= TestTransactionSubmission();
  ok &= TestProofDeadline();
  for (int round = 0; round < 3; ++round) {
    ok &= TestConcurrentSubmissionMatchesSerialReplay(round);
  }
  ok &= TestOptionsFromConfig();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "node_core_tests: OK\n";
  return EXIT_SUCCESS;
}
