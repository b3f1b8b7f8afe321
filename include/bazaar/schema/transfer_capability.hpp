#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: transfer capability.
// Marketplace workflow: hands a product or admin capability, and with it the
// privileged operations it guards, to another principal.
namespace bazaar::schema {

template <uint16_t Version>
struct transfer_capability;

template <>
struct transfer_capability<1> final {
  uint16_t version{1};
  object_id_t cap_id{};
  signer_id_t recipient{};
};

using transfer_capability_t = transfer_capability<1>;

}  // namespace bazaar::schema
