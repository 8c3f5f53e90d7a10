#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/network.hpp"

namespace veil::config {

struct NodeOptions {
  std::string network{"mainnet"};
  std::string data_dir;
  std::string config_path;
  bool disable_config_file{false};
  bool help_requested{false};
  std::uint64_t max_reorg_depth{100};
  std::size_t mempool_max_bytes{64u * 1024u * 1024u};
  std::size_t mempool_max_count{50'000};
  bool lock_diagnostics{false};
  std::uint64_t slow_lock_ms{100};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{10};
  std::size_t log_max_files{5};
  // Zero disables the proof verification deadline.
  std::uint64_t proof_deadline_ms{10'000};
};

// Throws std::runtime_error on malformed values.
bool ParseBool(const std::string& value);

// Keys are matched case-insensitively with '-' and '_' ignored. Unknown keys
// are logged and skipped.
void ApplyConfigOption(const std::string& raw_key, const std::string& value, NodeOptions* opts);

// `key=value` lines, '#' comments. A missing file is not an error.
void LoadConfigFile(const std::filesystem::path& path, NodeOptions* opts);

// VEIL_* environment variables, applied over the config file.
void ApplyEnvironmentOverrides(NodeOptions* opts);

// Resolution order: config file, environment, then `--key value` flags.
// Fills a per-network default data directory when none is given. Arguments
// that are not flags are collected into `positional`, or rejected when it is
// null.
NodeOptions ParseNodeOptions(const std::vector<std::string>& args,
                             std::vector<std::string>* positional = nullptr);

NetworkType SelectedNetwork(const NodeOptions& opts);

// Routes the process logger and lock diagnostics according to `opts`.
void ApplyProcessOptions(const NodeOptions& opts);

std::string UsageText();

}  // namespace veil::config
