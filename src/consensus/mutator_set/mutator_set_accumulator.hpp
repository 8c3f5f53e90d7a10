#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "consensus/mutator_set/active_window.hpp"
#include "consensus/mutator_set/mmr.hpp"
#include "consensus/mutator_set/mutator_set.hpp"

namespace veil::mutator_set {

// Compact backend: peaks of both MMRs plus the active window. Removal relies
// on the chunk data carried by each record. Cheap to copy, so validation
// applies blocks to a copy and compares roots.
class MutatorSetAccumulator final : public MutatorSet {
 public:
  MutatorSetAccumulator() = default;
  MutatorSetAccumulator(MmrAccumulator aocl, MmrAccumulator swbf_inactive, ActiveWindow window);

  std::uint64_t AoclLeafCount() const override { return aocl_.LeafCount(); }
  std::vector<primitives::Hash256> AoclPeaks() const override { return aocl_.Peaks(); }
  std::uint64_t SwbfInactiveLeafCount() const override { return swbf_inactive_.LeafCount(); }
  std::vector<primitives::Hash256> SwbfInactivePeaks() const override {
    return swbf_inactive_.Peaks();
  }
  const ActiveWindow& Window() const override { return window_; }

  void Add(const AdditionRecord& record) override;
  bool Remove(const RemovalRecord& record, std::vector<std::uint64_t>* flipped_indices,
              std::string* error) override;

  bool operator==(const MutatorSetAccumulator& other) const {
    return aocl_ == other.aocl_ && swbf_inactive_ == other.swbf_inactive_ &&
           window_ == other.window_;
  }

 private:
  MmrAccumulator aocl_;
  MmrAccumulator swbf_inactive_;
  ActiveWindow window_;
};

}  // namespace veil::mutator_set
