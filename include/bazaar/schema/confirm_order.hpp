#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: confirm order.
// Marketplace workflow: Release: the supplier confirms fulfillment and the
// whole escrow goes to the selected consumer.
namespace bazaar::schema {

template <uint16_t Version>
struct confirm_order;

template <>
struct confirm_order<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  object_id_t cap_id{};
};

using confirm_order_t = confirm_order<1>;

}  // namespace bazaar::schema
