#pragma once
#include <bazaar/schema/primitives.hpp>

// Schema type: choose consumer.
// Marketplace workflow: Selection: the product capability holder picks one
// pending bid and locks `payment` in escrow, closing the bidding.
namespace bazaar::schema {

template <uint16_t Version>
struct choose_consumer;

template <>
struct choose_consumer<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  object_id_t cap_id{};
  amount_t payment{};
  signer_id_t chosen{};
};

using choose_consumer_t = choose_consumer<1>;

}  // namespace bazaar::schema
