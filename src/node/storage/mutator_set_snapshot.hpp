#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "consensus/mutator_set/archival_mutator_set.hpp"
#include "primitives/hash.hpp"

namespace veil::storage {

// Which chain state a snapshot describes.
struct SnapshotTip {
  primitives::Hash256 block_hash{};
  std::uint64_t height{0};
};

// Writes the archival mutator set as of `tip` with an atomic replace.
bool SaveMutatorSetSnapshot(const std::filesystem::path& path,
                            const mutator_set::ArchivalMutatorSet& set, const SnapshotTip& tip,
                            std::string* error);

// Fails on a missing, corrupt or inconsistent file; callers fall back to
// replaying the archive.
bool LoadMutatorSetSnapshot(const std::filesystem::path& path, mutator_set::ArchivalMutatorSet* set,
                            SnapshotTip* tip, std::string* error);

}  // namespace veil::storage
