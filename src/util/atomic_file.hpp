#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace veil::util {

// Replaces `path` with `data` so that a reader sees either the old contents or
// the new ones. The bytes go to a sibling temp file that is synced before the
// rename, and the directory entry is synced after it where the platform allows.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

// Flushes the contents of an existing file to stable storage.
bool SyncFile(const std::filesystem::path& path, std::string* error = nullptr);

// Reads the whole file. Fails (with `error` set) if it cannot be opened or
// read completely.
bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error = nullptr);

}  // namespace veil::util
