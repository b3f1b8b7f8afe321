#pragma once
#include <bazaar/schema/primitives.hpp>
#include <string>
#include <utility>
#include <vector>

// Schema type: genesis.
// Marketplace workflow: one-time bootstrap. Names the chain, the principal
// receiving the arbitrator capability, and the opening account balances.
namespace bazaar::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::string chain_name{"bazaar-local"};
  signer_id_t admin{};
  std::vector<std::pair<signer_id_t, amount_t>> allocations;
};

using genesis_t = genesis<1>;

}  // namespace bazaar::schema
