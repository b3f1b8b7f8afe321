#pragma once
#include <bazaar/schema/capability_kind.hpp>
#include <bazaar/schema/primitives.hpp>

// Schema type: capability state.
// Marketplace workflow: possession token. The owner is the only principal
// that may present it; product capabilities are bound to one product id.
namespace bazaar::schema {

template <uint16_t Version>
struct capability_state;

template <>
struct capability_state<1> final {
  uint16_t version{1};
  object_id_t cap_id{};
  capability_kind_t kind{capability_kind_t::product};
  object_id_t product_id{};  // zero for the admin capability
  signer_id_t owner{};
};

using capability_state_t = capability_state<1>;

}  // namespace bazaar::schema
