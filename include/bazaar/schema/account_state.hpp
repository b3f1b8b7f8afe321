#pragma once
#include <bazaar/schema/primitives.hpp>

namespace bazaar::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  signer_id_t owner{};
  amount_t balance{};
};

using account_state_t = account_state<1>;

}  // namespace bazaar::schema
