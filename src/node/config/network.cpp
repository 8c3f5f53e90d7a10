#include "config/network.hpp"

#include <stdexcept>

namespace veil::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::uint32_t magic,
                          std::string subdir) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.storage_magic = magic;
  cfg.data_subdir = std::move(subdir);
  return cfg;
}

}  // namespace

const NetworkConfig& GetNetworkConfig(NetworkType type) {
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", 0x4c494556, "");
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", 0x544c4556, "testnet");
  static const NetworkConfig regtest =
      BuildConfig(NetworkType::kRegtest, "regtest", 0x524c4556, "regtest");
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

NetworkType NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "regtest" || name == "reg") return NetworkType::kRegtest;
  throw std::invalid_argument("unknown network: " + std::string(name));
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "mainnet";
}

}  // namespace veil::config
