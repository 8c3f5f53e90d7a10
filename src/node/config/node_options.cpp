#include "config/node_options.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "util/log.hpp"
#include "util/sync.hpp"

namespace veil::config {

namespace {

std::string_view Strip(std::string_view text) {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto begin = text.find_first_not_of(kSpace);
  if (begin == std::string_view::npos) {
    return {};
  }
  return text.substr(begin, text.find_last_not_of(kSpace) - begin + 1);
}

std::string Lowercase(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

// Case-insensitive, '-' and '_' ignored: "Max_Reorg-Depth" -> "maxreorgdepth".
std::string NormalizeKey(const std::string& key) {
  std::string out = Lowercase(key);
  out.erase(std::remove_if(out.begin(), out.end(), [](char c) { return c == '-' || c == '_'; }),
            out.end());
  return out;
}

std::uint64_t ParseUnsigned(const std::string& name, const std::string& value) {
  if (value.empty() || value.front() == '-') {
    throw std::runtime_error("invalid " + name + " (expected a non-negative integer)");
  }
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::runtime_error("trailing characters");
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + name + " (expected a non-negative integer)");
  }
}

bool IsFlagKey(const std::string& key) {
  static constexpr std::string_view kKeys[] = {
      "network",    "datadir",  "maxreorgdepth", "mempoolmaxbytes", "mempoolmaxcount",
      "slowlockms", "debuglog", "loglevel",      "logmaxsizemb",    "logmaxfiles",
      "proofdeadlinems",
  };
  for (auto known : kKeys) {
    if (key == known) return true;
  }
  return false;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  const char* raw = std::getenv(std::string(name).c_str());
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

// $XDG_DATA_HOME/veil, else ~/.veil, else ./data; non-mainnet networks get
// their own subdirectory.
std::filesystem::path DefaultDataDir(NetworkType network) {
  const auto xdg = GetEnvValue("XDG_DATA_HOME");
  const auto home = GetEnvValue("HOME");
  const std::filesystem::path base = xdg    ? std::filesystem::path(*xdg) / "veil"
                                     : home ? std::filesystem::path(*home) / ".veil"
                                            : std::filesystem::path("data");
  const auto& subdir = GetNetworkConfig(network).data_subdir;
  return subdir.empty() ? base : base / subdir;
}

}  // namespace

bool ParseBool(const std::string& value) {
  static constexpr std::string_view kTrue[] = {"", "1", "true", "yes", "on"};
  static constexpr std::string_view kFalse[] = {"0", "false", "no", "off"};
  const std::string word = Lowercase(value);
  if (std::find(std::begin(kTrue), std::end(kTrue), word) != std::end(kTrue)) {
    return true;
  }
  if (std::find(std::begin(kFalse), std::end(kFalse), word) != std::end(kFalse)) {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, NodeOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    opts->network = value;
  } else if (key == "datadir") {
    opts->data_dir = value;
  } else if (key == "maxreorgdepth") {
    opts->max_reorg_depth = ParseUnsigned(raw_key, value);
  } else if (key == "mempoolmaxbytes") {
    opts->mempool_max_bytes = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "mempoolmaxcount") {
    opts->mempool_max_count = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "lockdiagnostics") {
    opts->lock_diagnostics = ParseBool(value);
  } else if (key == "slowlockms") {
    opts->slow_lock_ms = ParseUnsigned(raw_key, value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "proofdeadlinems") {
    opts->proof_deadline_ms = ParseUnsigned(raw_key, value);
  } else if (key == "config" || key == "conf") {
    opts->config_path = value;
  } else {
    util::LogWarn("config", "unknown config key '" + raw_key + "'");
  }
}

void LoadConfigFile(const std::filesystem::path& path, NodeOptions* opts) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::size_t lineno = 0;
  for (std::string raw; std::getline(in, raw);) {
    ++lineno;
    const std::string_view line = Strip(std::string_view(raw).substr(0, raw.find('#')));
    if (line.empty()) {
      continue;
    }
    // A bare key is a switch turned on.
    const auto eq = line.find('=');
    const std::string key(Strip(line.substr(0, eq)));
    const std::string value = eq == std::string_view::npos ? std::string("1")
                                                           : std::string(Strip(line.substr(eq + 1)));
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(NodeOptions* opts) {
  static constexpr std::pair<std::string_view, std::string_view> kEnvKeys[] = {
      {"VEIL_NETWORK", "network"},
      {"VEIL_DATA_DIR", "datadir"},
      {"VEIL_MAX_REORG_DEPTH", "maxreorgdepth"},
      {"VEIL_MEMPOOL_MAX_BYTES", "mempoolmaxbytes"},
      {"VEIL_MEMPOOL_MAX_COUNT", "mempoolmaxcount"},
      {"VEIL_LOCK_DIAGNOSTICS", "lockdiagnostics"},
      {"VEIL_SLOW_LOCK_MS", "slowlockms"},
      {"VEIL_DEBUG_LOG", "debuglog"},
      {"VEIL_LOG_LEVEL", "loglevel"},
      {"VEIL_LOG_MAX_SIZE_MB", "logmaxsizemb"},
      {"VEIL_LOG_MAX_FILES", "logmaxfiles"},
      {"VEIL_PROOF_DEADLINE_MS", "proofdeadlinems"},
  };
  for (const auto& [env, key] : kEnvKeys) {
    if (auto value = GetEnvValue(env)) {
      try {
        ApplyConfigOption(std::string(key), *value, opts);
      } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(env) + ": " + ex.what());
      }
    }
  }
}

NodeOptions ParseNodeOptions(const std::vector<std::string>& raw_args,
                             std::vector<std::string>* positional) {
  NodeOptions opts;
  std::vector<std::string> args;
  args.reserve(raw_args.size());
  for (const auto& token : raw_args) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (args[i] == "--no-conf") {
      opts.disable_config_file = true;
    }
  }
  if (!opts.disable_config_file) {
    const std::filesystem::path config_path = opts.config_path.empty()
                                                  ? std::filesystem::path("veil.conf")
                                                  : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      opts.help_requested = true;
    } else if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else if (arg == "--lock-diagnostics") {
      opts.lock_diagnostics = true;
    } else if (arg.rfind("--", 0) == 0) {
      // Every other flag mirrors a config key: --max-reorg-depth <n>.
      const std::string key = arg.substr(2);
      if (!IsFlagKey(NormalizeKey(key))) {
        throw std::runtime_error("unknown option: " + arg);
      }
      ApplyConfigOption(key, ensure_value(i), &opts);
    } else if (positional) {
      positional->push_back(arg);
    } else {
      throw std::runtime_error("unexpected argument: " + arg);
    }
  }

  const auto network = SelectedNetwork(opts);
  if (opts.data_dir.empty()) {
    opts.data_dir = DefaultDataDir(network).string();
  }
  return opts;
}

NetworkType SelectedNetwork(const NodeOptions& opts) {
  try {
    return NetworkFromString(opts.network);
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error(ex.what());
  }
}

void ApplyProcessOptions(const NodeOptions& opts) {
  auto& logger = util::GetLogger();
  logger.Configure(util::ParseLogLevelString(opts.log_level),
                   static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024u * 1024u,
                   opts.log_max_files);
  if (!opts.debug_log_path.empty()) {
    logger.EnableFile(opts.debug_log_path);
  }
  if (opts.lock_diagnostics) {
    util::sync::SetGlobalLockObserver(std::make_shared<util::sync::SlowLockLogger>(
        std::chrono::milliseconds(opts.slow_lock_ms)));
  } else {
    util::sync::SetGlobalLockObserver(nullptr);
  }
}

std::string UsageText() {
  std::ostringstream oss;
  oss << "Options:\n"
      << "  --network <name>           mainnet, testnet or regtest (default: mainnet)\n"
      << "  --data-dir <path>          Data directory (default: ~/.veil[/<network>])\n"
      << "  --max-reorg-depth <n>      Deepest reorganization accepted (default: 100)\n"
      << "  --mempool-max-bytes <n>    Mempool size cap in bytes\n"
      << "  --mempool-max-count <n>    Mempool entry cap\n"
      << "  --lock-diagnostics         Log slow lock holds\n"
      << "  --slow-lock-ms <ms>        Slow lock threshold (default: 100)\n"
      << "  --proof-deadline-ms <ms>   Proof verification deadline, 0 to disable\n"
      << "  --debug-log <path>         Append logs to the given file\n"
      << "  --log-level <lvl>          debug, info, warn, error (default: info)\n"
      << "  --log-max-size-mb <mb>     Rotate the log file after <mb> megabytes\n"
      << "  --log-max-files <n>        Rotated log files to keep\n"
      << "  --conf <path>              Config file (default: ./veil.conf)\n"
      << "  --no-conf                  Skip the config file\n";
  return oss.str();
}

}  // namespace veil::config
