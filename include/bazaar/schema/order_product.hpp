#pragma once
#include <bazaar/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: order product.
// Marketplace workflow: Bid submission: attaches the signer's consumer
// profile to an open product.
namespace bazaar::schema {

template <uint16_t Version>
struct order_product;

template <>
struct order_product<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  std::string description;
  std::vector<std::string> requirements;
};

using order_product_t = order_product<1>;

}  // namespace bazaar::schema
