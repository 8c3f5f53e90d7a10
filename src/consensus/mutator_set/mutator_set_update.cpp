#include "consensus/mutator_set/mutator_set_update.hpp"

namespace veil::mutator_set {

bool MutatorSetUpdate::Apply(MutatorSet* set, MutatorSetDelta* delta, std::string* error,
                             const std::vector<RemovalRecord*>& preserved) const {
  if (!set) {
    if (error) *error = "no mutator set";
    return false;
  }
  std::vector<RemovalRecord> pending = removals;
  std::vector<RemovalRecord*> tracked;
  tracked.reserve(pending.size() + preserved.size());
  for (auto& record : pending) {
    tracked.push_back(&record);
  }
  tracked.insert(tracked.end(), preserved.begin(), preserved.end());

  for (const auto& addition : additions) {
    RemovalRecord::BatchUpdateFromAddition(tracked, *set);
    set->Add(addition);
  }

  MutatorSetDelta out;
  out.additions = additions.size();
  for (std::size_t i = 0; i < pending.size(); ++i) {
    std::vector<std::uint64_t> flipped;
    if (!set->Remove(pending[i], &flipped, error)) {
      return false;
    }
    out.flipped_indices.insert(out.flipped_indices.end(), flipped.begin(), flipped.end());
    std::vector<RemovalRecord*> rest(tracked.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                     tracked.end());
    RemovalRecord::BatchUpdateFromRemove(rest, pending[i]);
  }
  if (delta) {
    *delta = std::move(out);
  }
  return true;
}

}  // namespace veil::mutator_set
