#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: resolve dispute for supplier.
// Marketplace workflow: Arbitration: the admin capability holder returns the
// escrow to the product's supplier.
namespace bazaar::schema {

template <uint16_t Version>
struct resolve_dispute_for_supplier;

template <>
struct resolve_dispute_for_supplier<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  object_id_t complaint_id{};
  object_id_t admin_cap_id{};
};

using resolve_dispute_for_supplier_t = resolve_dispute_for_supplier<1>;

}  // namespace bazaar::schema
