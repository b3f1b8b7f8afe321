#pragma once
#include <bazaar/schema/primitives.hpp>

namespace bazaar::schema {

template <uint16_t Version>
struct transfer_funds;

template <>
struct transfer_funds<1> final {
  uint16_t version{1};
  signer_id_t recipient{};
  amount_t amount{};
};

using transfer_funds_t = transfer_funds<1>;

}  // namespace bazaar::schema
