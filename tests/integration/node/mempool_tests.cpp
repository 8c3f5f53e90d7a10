#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/params.hpp"
#include "consensus/tx_validator.hpp"
#include "node/chain_view.hpp"
#include "node/mempool.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "unit/util/regtest_chain.hpp"

namespace {

using namespace veil;

const consensus::ChainParams& Regtest() { return consensus::Params(config::NetworkType::kRegtest); }

// Serves the builder's current accumulator as the canonical tip.
class BuilderView final : public node::ChainView {
 public:
  explicit BuilderView(const test::RegtestChain& chain) : chain_(chain) {}
  primitives::Hash256 TipHash() const override { return chain_.TipHash(); }
  std::uint64_t TipHeight() const override { return chain_.TipHeight(); }
  mutator_set::MutatorSetAccumulator TipAccumulator() const override {
    return chain_.Set().Snapshot();
  }
  node::TipState CurrentTip() const override {
    return node::TipState{chain_.TipHash(), chain_.TipHeight(), chain_.Set().Snapshot()};
  }
  node::TipState RefreshRemovalRecords(
      const std::vector<mutator_set::RemovalRecord*>& records) const override {
    for (auto* record : records) {
      if (!chain_.Set().RefreshTargetChunks(record, nullptr)) {
        ++refresh_failures_;
      }
    }
    return CurrentTip();
  }

  std::size_t RefreshFailures() const { return refresh_failures_; }

 private:
  const test::RegtestChain& chain_;
  mutable std::size_t refresh_failures_{0};
};

test::RegtestChain FundedChain(const std::string& label, int coins) {
  test::RegtestChain chain(Regtest(), label);
  for (int i = 0; i < coins; ++i) {
    chain.Extend();
  }
  return chain;
}

node::MempoolOptions Options(std::size_t max_count, std::uint64_t max_bytes = 64ULL << 20) {
  node::MempoolOptions options;
  options.max_count = max_count;
  options.max_bytes = max_bytes;
  options.clock = [] { return std::uint64_t{1'700'000'000}; };
  return options;
}

bool Expect(bool ok, const char* what, const consensus::ValidationState& state) {
  if (!ok) {
    std::cerr << "mempool_tests: " << what << ": " << state.ToString() << "\n";
  }
  return ok;
}

bool TestSnapshotOrder() {
  auto chain = FundedChain("order", 4);
  BuilderView view(chain);
  node::Mempool pool(Options(100));
  const auto& coins = chain.Coins();
  const auto low = chain.Spend(coins[0], 1'000);
  const auto high_first = chain.Spend(coins[1], 3'000);
  const auto high_second = chain.Spend(coins[2], 3'000);
  const auto mid = chain.Spend(coins[3], 2'000);
  consensus::ValidationState state;
  for (const auto* tx : {&low, &high_first, &high_second, &mid}) {
    if (!Expect(pool.Insert(*tx, view, &state), "insert", state)) {
      return false;
    }
  }
  const auto snapshot = pool.Snapshot();
  const std::vector<primitives::Hash256> expected = {
      primitives::ComputeTxId(high_first), primitives::ComputeTxId(high_second),
      primitives::ComputeTxId(mid), primitives::ComputeTxId(low)};
  if (snapshot.size() != expected.size()) {
    std::cerr << "mempool_tests: snapshot size " << snapshot.size() << "\n";
    return false;
  }
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (snapshot[i].txid != expected[i]) {
      std::cerr << "mempool_tests: snapshot position " << i << " out of order\n";
      return false;
    }
  }
  std::uint64_t total = 0;
  for (const auto& entry : snapshot) {
    total += entry.size_bytes;
  }
  if (pool.Bytes() != total || pool.Size() != 4) {
    std::cerr << "mempool_tests: size accounting mismatch\n";
    return false;
  }
  return true;
}

bool TestCapacityEviction() {
  auto chain = FundedChain("capacity", 5);
  BuilderView view(chain);
  node::Mempool pool(Options(3));
  const auto& coins = chain.Coins();
  const auto fee100 = chain.Spend(coins[0], 10'000);
  const auto fee300 = chain.Spend(coins[1], 30'000);
  const auto fee200 = chain.Spend(coins[2], 20'000);
  consensus::ValidationState state;
  if (!pool.Insert(fee100, view, &state) || !pool.Insert(fee300, view, &state) ||
      !pool.Insert(fee200, view, &state)) {
    return Expect(false, "filling the pool", state);
  }

  state = {};
  if (pool.Insert(chain.Spend(coins[3], 5'000), view, &state) ||
      state.reason != consensus::RejectReason::kFeeTooLow || pool.Size() != 3) {
    std::cerr << "mempool_tests: low feerate admitted to a full pool\n";
    return false;
  }
  state = {};
  if (pool.Insert(chain.Spend(coins[3], 10'000), view, &state) ||
      state.reason != consensus::RejectReason::kFeeTooLow) {
    std::cerr << "mempool_tests: equal feerate displaced the minimum\n";
    return false;
  }
  const auto fee400 = chain.Spend(coins[4], 40'000);
  state = {};
  if (!Expect(pool.Insert(fee400, view, &state), "high feerate into a full pool", state)) {
    return false;
  }
  if (pool.Size() != 3 || pool.Contains(primitives::ComputeTxId(fee100)) ||
      !pool.Contains(primitives::ComputeTxId(fee400))) {
    std::cerr << "mempool_tests: eviction did not remove the lowest feerate\n";
    return false;
  }
  return true;
}

bool TestSurvivorsAreTheBestPaying() {
  auto chain = FundedChain("survivors", 10);
  BuilderView view(chain);
  node::Mempool pool(Options(4));
  const std::vector<primitives::Amount> fees = {7'000, 2'000, 9'000, 1'000, 8'000,
                                                3'000, 10'000, 4'000, 6'000, 5'000};
  for (std::size_t i = 0; i < fees.size(); ++i) {
    consensus::ValidationState state;
    const bool inserted = pool.Insert(chain.Spend(chain.Coins()[i], fees[i]), view, &state);
    if (!inserted && state.reason != consensus::RejectReason::kFeeTooLow) {
      return Expect(false, "insert under pressure", state);
    }
  }
  const auto snapshot = pool.Snapshot();
  std::vector<primitives::Amount> kept;
  for (const auto& entry : snapshot) {
    kept.push_back(entry.fee);
  }
  if (kept != std::vector<primitives::Amount>{10'000, 9'000, 8'000, 7'000}) {
    std::cerr << "mempool_tests: survivors are not the best-paying transactions\n";
    return false;
  }
  return true;
}

bool TestByteBudget() {
  auto chain = FundedChain("bytes", 3);
  BuilderView view(chain);
  const auto sample = chain.Spend(chain.Coins()[0], 1);
  const auto one = primitives::serialize::SerializedTransactionSize(sample);
  node::Mempool pool(Options(100, one * 2 + one / 2));
  consensus::ValidationState state;
  for (std::size_t i = 0; i < 2; ++i) {
    if (!Expect(pool.Insert(chain.Spend(chain.Coins()[i], 1'000 * (i + 1)), view, &state),
                "insert within byte budget", state)) {
      return false;
    }
  }
  if (!Expect(pool.Insert(chain.Spend(chain.Coins()[2], 5'000), view, &state),
              "insert over byte budget", state)) {
    return false;
  }
  if (pool.Size() != 2 || pool.Bytes() > one * 2 + one / 2) {
    std::cerr << "mempool_tests: byte budget not enforced\n";
    return false;
  }
  node::Mempool tiny(Options(100, one - 1));
  state = {};
  if (tiny.Insert(sample, view, &state) || state.reason != consensus::RejectReason::kFeeTooLow) {
    std::cerr << "mempool_tests: oversized transaction admitted\n";
    return false;
  }
  return true;
}

// Input-less transaction with `outputs` fresh outputs.
primitives::CTransaction Payout(test::RegtestChain& chain, const std::string& label,
                                std::size_t outputs, primitives::Amount fee) {
  auto tx = chain.Spend(test::MakeCoin(label, 0), fee);
  for (std::size_t i = 1; i < outputs; ++i) {
    tx.kernel.outputs.push_back(test::MakeCoin(label, i).Addition());
  }
  tx.proof = chain.Proofs().Prove(consensus::TransactionStatement(tx));
  return tx;
}

bool TestFullPoolNeverAdmitsItsOwnVictim() {
  auto chain = FundedChain("own-victim", 0);
  BuilderView view(chain);
  const auto low = Payout(chain, "low", 1, 100);
  const auto high = Payout(chain, "high", 1, 100'000);
  const auto wide = Payout(chain, "wide", 4, 2'000);
  const auto low_size = primitives::serialize::SerializedTransactionSize(low);
  const auto high_size = primitives::serialize::SerializedTransactionSize(high);
  const auto wide_size = primitives::serialize::SerializedTransactionSize(wide);
  const auto wide_rate = node::ComputeFeerate(wide.kernel.fee, wide_size);
  if (wide_size <= low_size || wide_rate <= node::ComputeFeerate(low.kernel.fee, low_size) ||
      wide_rate >= node::ComputeFeerate(high.kernel.fee, high_size)) {
    std::cerr << "mempool_tests: fixture sizes do not order as expected\n";
    return false;
  }
  node::Mempool pool(Options(100, high_size + wide_size - 1));
  consensus::ValidationState state;
  if (!Expect(pool.Insert(low, view, &state), "low into pool", state) ||
      !Expect(pool.Insert(high, view, &state), "high into pool", state)) {
    return false;
  }

  // Room for `wide` needs both residents gone, and `high` outbids it.
  state = {};
  if (pool.Insert(wide, view, &state) || state.reason != consensus::RejectReason::kFeeTooLow) {
    std::cerr << "mempool_tests: entry admitted although it would be evicted\n";
    return false;
  }
  if (pool.Size() != 2 || !pool.Contains(primitives::ComputeTxId(low)) ||
      !pool.Contains(primitives::ComputeTxId(high)) || pool.Bytes() != low_size + high_size) {
    std::cerr << "mempool_tests: rejected admission changed the pool\n";
    return false;
  }

  const auto rich = Payout(chain, "rich", 4, 1'000'000);
  state = {};
  if (!Expect(pool.Insert(rich, view, &state), "outbidding both residents", state)) {
    return false;
  }
  if (pool.Size() != 1 || !pool.Contains(primitives::ComputeTxId(rich)) ||
      pool.EvictToCapacity() != 0) {
    std::cerr << "mempool_tests: displacement left the pool over budget\n";
    return false;
  }
  return true;
}

bool TestAdmissionFollowsThePoolTip() {
  auto chain = FundedChain("tip-sync", 3);
  BuilderView view(chain);
  node::Mempool pool(Options(100));
  const auto coins = chain.Coins();
  consensus::ValidationState state;
  if (!Expect(pool.Insert(chain.Spend(coins[0], 1'000), view, &state), "insert at tip", state)) {
    return false;
  }
  const auto predecessor = chain.Set().Snapshot();
  const auto block = chain.Extend();

  // The chain moved but the pool has not been told; its entries are still
  // valid only against the old tip.
  const auto late = chain.Spend(coins[1], 2'000);
  state = {};
  if (pool.Insert(late, view, &state) || state.reason != consensus::RejectReason::kConflict ||
      pool.Size() != 1) {
    std::cerr << "mempool_tests: admitted against a tip the pool has not reached\n";
    return false;
  }
  if (pool.RemoveConfirmed(block, predecessor) != 0) {
    std::cerr << "mempool_tests: unrelated block removed entries\n";
    return false;
  }
  state = {};
  if (!Expect(pool.Insert(late, view, &state), "insert after catching up", state)) {
    return false;
  }
  if (pool.Size() != 2 || pool.Revalidate(view) != 0 || view.RefreshFailures() != 0) {
    std::cerr << "mempool_tests: entries not valid at the shared tip\n";
    return false;
  }
  return true;
}

bool TestConflictReplacement() {
  auto chain = FundedChain("conflict", 1);
  BuilderView view(chain);
  node::Mempool pool(Options(100));
  const auto& coin = chain.Coins()[0];
  const auto first = chain.Spend(coin, 1'000);
  const auto same_fee = chain.Spend(coin, 1'000);
  const auto better = chain.Spend(coin, 5'000);
  consensus::ValidationState state;
  if (!Expect(pool.Insert(first, view, &state), "first spend", state)) {
    return false;
  }
  state = {};
  if (pool.Insert(first, view, &state) || state.reason != consensus::RejectReason::kAlreadyKnown) {
    std::cerr << "mempool_tests: duplicate not reported as known\n";
    return false;
  }
  state = {};
  if (pool.Insert(same_fee, view, &state) || state.reason != consensus::RejectReason::kConflict) {
    std::cerr << "mempool_tests: equal-fee conflict accepted\n";
    return false;
  }
  state = {};
  if (!Expect(pool.Insert(better, view, &state), "higher-fee replacement", state)) {
    return false;
  }
  if (pool.Size() != 1 || pool.Contains(primitives::ComputeTxId(first)) ||
      !pool.Contains(primitives::ComputeTxId(better))) {
    std::cerr << "mempool_tests: replacement left the pool inconsistent\n";
    return false;
  }
  return true;
}

bool TestRejectsCoinbaseAndSpentInputs() {
  auto chain = FundedChain("rejects", 2);
  BuilderView view(chain);
  node::Mempool pool(Options(100));
  consensus::ValidationState state;

  auto coinbase = chain.Spend(chain.Coins()[0], 0);
  coinbase.kernel.inputs.clear();
  coinbase.kernel.coinbase = 50;
  if (pool.Insert(coinbase, view, &state) || state.reason != consensus::RejectReason::kMalformed) {
    std::cerr << "mempool_tests: coinbase admitted\n";
    return false;
  }

  const auto coin = chain.Coins()[1];
  chain.Extend({chain.Spend(coin, 100)});
  state = {};
  if (pool.Insert(chain.Spend(coin, 100'000), view, &state) ||
      state.reason != consensus::RejectReason::kInvalidRemoval) {
    std::cerr << "mempool_tests: spend of a confirmed input admitted: " << state.ToString()
              << "\n";
    return false;
  }
  return pool.Size() == 0;
}

bool TestRemoveConfirmed() {
  auto chain = FundedChain("confirm", 3);
  BuilderView view(chain);
  node::Mempool pool(Options(100));
  const auto coins = chain.Coins();
  const auto included = chain.Spend(coins[0], 1'000);
  const auto conflicting = chain.Spend(coins[1], 1'000);
  const auto unrelated = chain.Spend(coins[2], 1'000);
  consensus::ValidationState state;
  for (const auto* tx : {&included, &conflicting, &unrelated}) {
    if (!Expect(pool.Insert(*tx, view, &state), "insert", state)) {
      return false;
    }
  }
  const auto predecessor = chain.Set().Snapshot();
  const auto block = chain.Extend({included, chain.Spend(coins[1], 700)});
  const auto removed = pool.RemoveConfirmed(block, predecessor);
  if (removed != 2 || pool.Size() != 1 || !pool.Contains(primitives::ComputeTxId(unrelated))) {
    std::cerr << "mempool_tests: RemoveConfirmed removed " << removed << "\n";
    return false;
  }
  // The survivor was carried across the block and still verifies.
  if (pool.Revalidate(view) != 0) {
    std::cerr << "mempool_tests: carried-forward entry no longer removable\n";
    return false;
  }
  const auto next = chain.Extend({pool.Snapshot().front().tx});
  if (pool.RemoveConfirmed(next, std::nullopt) != 1 || pool.Size() != 0) {
    std::cerr << "mempool_tests: carried-forward entry not removed when mined\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestSnapshotOrder();
  ok &= TestCapacityEviction();
  ok &= TestSurvivorsAreTheBestPaying();
  ok &= TestByteBudget();
  ok &= TestFullPoolNeverAdmitsItsOwnVictim();
  ok &= TestAdmissionFollowsThePoolTip();
  ok &= TestConflictReplacement();
  ok &= TestRejectsCoinbaseAndSpentInputs();
  ok &= TestRemoveConfirmed();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "mempool_tests: OK\n";
  return EXIT_SUCCESS;
}
