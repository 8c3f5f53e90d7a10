#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "consensus/mutator_set/mmr.hpp"
#include "unit/util/regtest_chain.hpp"

using namespace veil;

namespace {

using mutator_set::ArchivalMmr;
using mutator_set::MmrAccumulator;
using mutator_set::MmrMembershipProof;

primitives::Hash256 Leaf(std::uint64_t n) { return test::LabelHash("mmr-leaf", n); }

bool TestBackendsAgree() {
  MmrAccumulator accumulator;
  ArchivalMmr archival;
  std::vector<MmrMembershipProof> tracked;
  for (std::uint64_t i = 0; i < 13; ++i) {
    const auto old_peaks = accumulator.Peaks();
    const auto old_count = accumulator.LeafCount();
    for (auto& proof : tracked) {
      proof.UpdateFromAppend(old_count, Leaf(i), old_peaks);
    }
    tracked.push_back(accumulator.Append(Leaf(i)));
    archival.Append(Leaf(i));
    if (accumulator.Peaks() != archival.Peaks() || accumulator.LeafCount() != i + 1) {
      std::cerr << "mmr_tests: peaks diverged after leaf " << i << "\n";
      return false;
    }
  }
  // 13 = 8 + 4 + 1 leaves.
  if (accumulator.Peaks().size() != 3) {
    std::cerr << "mmr_tests: expected three peaks for 13 leaves\n";
    return false;
  }
  for (std::uint64_t i = 0; i < 13; ++i) {
    MmrMembershipProof proof;
    if (!archival.Prove(i, &proof) || !(proof == tracked[i]) ||
        !accumulator.Verify(proof, Leaf(i))) {
      std::cerr << "mmr_tests: proof for leaf " << i << " is not consistent\n";
      return false;
    }
    if (accumulator.Verify(proof, Leaf(i + 100))) {
      std::cerr << "mmr_tests: proof verified for the wrong leaf\n";
      return false;
    }
  }
  return true;
}

bool TestLeafMutation() {
  MmrAccumulator accumulator;
  ArchivalMmr archival;
  for (std::uint64_t i = 0; i < 6; ++i) {
    accumulator.Append(Leaf(i));
    archival.Append(Leaf(i));
  }
  MmrMembershipProof mutated;
  MmrMembershipProof neighbour;
  archival.Prove(4, &mutated);
  archival.Prove(5, &neighbour);
  const auto replacement = Leaf(500);
  if (!accumulator.MutateLeaf(mutated, replacement) || !archival.MutateLeaf(4, replacement)) {
    std::cerr << "mmr_tests: leaf mutation failed\n";
    return false;
  }
  if (accumulator.Peaks() != archival.Peaks()) {
    std::cerr << "mmr_tests: mutation diverged between backends\n";
    return false;
  }
  if (accumulator.Verify(neighbour, Leaf(5))) {
    std::cerr << "mmr_tests: stale sibling proof still verifies\n";
    return false;
  }
  if (!neighbour.UpdateFromLeafMutation(mutated, replacement) ||
      !accumulator.Verify(neighbour, Leaf(5))) {
    std::cerr << "mmr_tests: sibling proof was not refreshed by the mutation\n";
    return false;
  }
  return true;
}

bool TestRemoveLast() {
  ArchivalMmr archival;
  std::vector<std::vector<primitives::Hash256>> history;
  for (std::uint64_t i = 0; i < 9; ++i) {
    history.push_back(archival.Peaks());
    archival.Append(Leaf(i));
  }
  for (std::uint64_t i = 9; i-- > 0;) {
    primitives::Hash256 removed{};
    if (!archival.RemoveLast(&removed) || removed != Leaf(i) || archival.Peaks() != history[i]) {
      std::cerr << "mmr_tests: RemoveLast did not restore the state before leaf " << i << "\n";
      return false;
    }
  }
  primitives::Hash256 removed{};
  if (archival.RemoveLast(&removed)) {
    std::cerr << "mmr_tests: RemoveLast succeeded on an empty MMR\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestBackendsAgree() || !TestLeafMutation() || !TestRemoveLast()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
