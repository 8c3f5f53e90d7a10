#pragma once

#include <cstdint>
#include <vector>

#include "consensus/mutator_set/records.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace veil::primitives {

// Public part of a transaction. Inputs are removal records against the
// mutator set, outputs are addition records; amounts stay hidden behind the
// validity proof except for the fee and the coinbase claim.
struct CTransactionKernel {
  std::vector<mutator_set::RemovalRecord> inputs{};
  std::vector<mutator_set::AdditionRecord> outputs{};
  Amount fee{0};
  // Newly minted amount claimed by this transaction; zero except for
  // block-reward transactions.
  Amount coinbase{0};
  std::uint64_t timestamp{0};

  bool operator==(const CTransactionKernel& other) const = default;
};

struct CTransaction {
  CTransactionKernel kernel{};
  std::vector<std::uint8_t> proof{};

  bool operator==(const CTransaction& other) const = default;

  [[nodiscard]] bool IsCoinbase() const noexcept { return kernel.coinbase != 0; }
};

}  // namespace veil::primitives
