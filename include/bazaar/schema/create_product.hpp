#pragma once
#include <bazaar/schema/primitives.hpp>
#include <string>

// Schema type: create product.
// Marketplace workflow: Listing: the signer becomes the supplier of a new
// product and receives its capability. The deadline is the block time plus
// `duration`.
namespace bazaar::schema {

template <uint16_t Version>
struct create_product;

template <>
struct create_product<1> final {
  uint16_t version{1};
  std::string description;
  uint32_t quality{};
  amount_t price{};
  duration_milliseconds_t duration{};
};

using create_product_t = create_product<1>;

}  // namespace bazaar::schema
