#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace veil::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  // Record magic of the archival block file; keeps data directories of
  // different networks from being mixed up.
  std::uint32_t storage_magic{0x4c494556};
  // Subdirectory of the data directory holding this network's files.
  std::string data_subdir;
};

const NetworkConfig& GetNetworkConfig(NetworkType type);
// Throws std::invalid_argument on an unknown name.
NetworkType NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace veil::config
