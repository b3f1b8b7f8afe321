#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: resolve dispute for consumer.
// Marketplace workflow: Arbitration: the admin capability holder releases the
// escrow to the complaint's consumer.
namespace bazaar::schema {

template <uint16_t Version>
struct resolve_dispute_for_consumer;

template <>
struct resolve_dispute_for_consumer<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  object_id_t complaint_id{};
  object_id_t admin_cap_id{};
};

using resolve_dispute_for_consumer_t = resolve_dispute_for_consumer<1>;

}  // namespace bazaar::schema
