#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/node_options.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/params.hpp"
#include "node/chain_state.hpp"
#include "nlohmann/json.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace {

using namespace veil;

std::string HashToHex(const primitives::Hash256& hash) {
  return util::HexEncode(std::span<const std::uint8_t>(hash.data(), hash.size()));
}

std::uint64_t ParseHeight(const std::string& value) {
  std::size_t consumed = 0;
  const unsigned long long parsed = std::stoull(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error("invalid height: " + value);
  }
  return static_cast<std::uint64_t>(parsed);
}

nlohmann::json HeaderToJson(const primitives::CBlockHeader& header,
                            const primitives::Hash256& hash) {
  nlohmann::json out;
  out["hash"] = HashToHex(hash);
  out["height"] = header.height;
  out["version"] = header.version;
  out["previous_block_hash"] = HashToHex(header.previous_block_hash);
  out["timestamp"] = header.timestamp;
  out["difficulty_bits"] = header.difficulty_bits;
  out["nonce"] = header.nonce;
  out["body_root"] = HashToHex(header.body_root);
  out["mutator_set_root"] = HashToHex(header.mutator_set_root);
  out["cumulative_work"] = util::HexEncode(
      std::span<const std::uint8_t>(header.cumulative_work.data(), header.cumulative_work.size()));
  return out;
}

nlohmann::json HandleTip(const node::ChainState& chain) {
  const auto tip = chain.Tip();
  if (!tip) {
    throw std::runtime_error("chain is empty");
  }
  nlohmann::json out = HeaderToJson(tip->header, tip->hash);
  out["accumulator_root"] = HashToHex(chain.AccumulatorRoot());
  const auto telemetry = chain.GetTelemetry();
  out["snapshot_dirty"] = telemetry.snapshot_dirty;
  return out;
}

nlohmann::json HandleBlock(const node::ChainState& chain, std::uint64_t height) {
  primitives::CBlock block;
  std::string error;
  if (!chain.GetBlockByHeight(height, &block, &error)) {
    throw std::runtime_error(error);
  }
  nlohmann::json out =
      HeaderToJson(block.header, consensus::ComputeBlockHash(block.header));
  nlohmann::json txs = nlohmann::json::array();
  for (const auto& tx : block.transactions) {
    nlohmann::json entry;
    entry["txid"] = HashToHex(primitives::ComputeTxId(tx));
    entry["inputs"] = tx.kernel.inputs.size();
    entry["outputs"] = tx.kernel.outputs.size();
    entry["fee"] = tx.kernel.fee;
    entry["coinbase"] = tx.kernel.coinbase;
    entry["proof_bytes"] = tx.proof.size();
    txs.push_back(std::move(entry));
  }
  out["transactions"] = std::move(txs);
  out["proof_bytes"] = block.proof.size();
  return out;
}

nlohmann::json HandleMmrProof(const node::ChainState& chain, std::uint64_t height) {
  primitives::CBlock block;
  std::string error;
  if (!chain.GetBlockByHeight(height, &block, &error)) {
    throw std::runtime_error(error);
  }
  const auto hash = consensus::ComputeBlockHash(block.header);
  node::BlockMmrProof proof;
  if (!chain.GetBlockMmrProof(hash, &proof, &error)) {
    throw std::runtime_error(error);
  }
  nlohmann::json out;
  out["block_hash"] = HashToHex(hash);
  out["leaf_index"] = proof.proof.leaf_index;
  out["leaf_count"] = proof.leaf_count;
  nlohmann::json path = nlohmann::json::array();
  for (const auto& node : proof.proof.authentication_path) {
    path.push_back(HashToHex(node));
  }
  out["authentication_path"] = std::move(path);
  nlohmann::json peaks = nlohmann::json::array();
  for (const auto& peak : proof.peaks) {
    peaks.push_back(HashToHex(peak));
  }
  out["peaks"] = std::move(peaks);
  out["verified"] =
      storage::ArchivalIndex::VerifyMmrProof(hash, proof.proof, proof.peaks, proof.leaf_count);
  return out;
}

nlohmann::json HandleTips(const node::ChainState& chain) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& tip : chain.GetChainTips()) {
    nlohmann::json entry;
    entry["hash"] = HashToHex(tip.hash);
    entry["height"] = tip.height;
    entry["branch_length"] = tip.branch_length;
    if (tip.is_best_tip) {
      entry["status"] = "active";
    } else if (tip.failed) {
      entry["status"] = "invalid";
    } else {
      entry["status"] = "valid-fork";
    }
    out.push_back(std::move(entry));
  }
  return out;
}

void PrintUsage() {
  std::cout << "Usage: veil-ledger [options] <command>\n\n"
            << "Commands:\n"
            << "  tip                  Canonical tip and accumulator root\n"
            << "  block <height>       Canonical block at <height>\n"
            << "  mmr-proof <height>   Block MMR membership proof\n"
            << "  tips                 Known chain tips\n\n"
            << config::UsageText();
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::vector<std::string> command;
    const auto opts = veil::config::ParseNodeOptions(args, &command);
    if (opts.help_requested || command.empty()) {
      PrintUsage();
      return opts.help_requested ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    veil::config::ApplyProcessOptions(opts);

    const auto& params = veil::consensus::Params(veil::config::SelectedNetwork(opts));
    veil::node::ChainStateOptions chain_options;
    chain_options.data_dir = opts.data_dir;
    chain_options.max_reorg_depth = opts.max_reorg_depth;
    veil::node::ChainState chain(params, chain_options);
    std::string error;
    if (!chain.Initialize(&error)) {
      throw std::runtime_error("failed to open " + opts.data_dir + ": " + error);
    }

    nlohmann::json result;
    const std::string& name = command.front();
    if (name == "tip" && command.size() == 1) {
      result = HandleTip(chain);
    } else if (name == "block" && command.size() == 2) {
      result = HandleBlock(chain, ParseHeight(command[1]));
    } else if (name == "mmr-proof" && command.size() == 2) {
      result = HandleMmrProof(chain, ParseHeight(command[1]));
    } else if (name == "tips" && command.size() == 1) {
      result = HandleTips(chain);
    } else {
      PrintUsage();
      return EXIT_FAILURE;
    }
    std::cout << result.dump(2) << "\n";
  } catch (const std::exception& ex) {
    std::cerr << "veil-ledger: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
