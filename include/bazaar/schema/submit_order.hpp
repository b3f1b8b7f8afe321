#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: submit order.
// Marketplace workflow: the selected consumer confirms intent to proceed
// before the deadline.
namespace bazaar::schema {

template <uint16_t Version>
struct submit_order;

template <>
struct submit_order<1> final {
  uint16_t version{1};
  object_id_t product_id{};
};

using submit_order_t = submit_order<1>;

}  // namespace bazaar::schema
