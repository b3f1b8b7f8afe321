#pragma once

#include <bazaar/schema/consumer_state.hpp>
#include <bazaar/schema/product_phase.hpp>
#include <bazaar/schema/product_state.hpp>

#include <string>
#include <vector>

namespace bazaar::market {

/// Build a bid profile for `product_id`. Pure; the product is untouched
/// until the profile is submitted with an order_product transaction, which
/// rejects tag lists containing duplicates.
bazaar::schema::consumer_state_t new_consumer(
    const bazaar::schema::object_id_t& product_id,
    const bazaar::schema::signer_id_t& bidder,
    std::string description,
    const std::vector<std::string>& requirements);

/// Where the product sits in its lifecycle.
bazaar::schema::product_phase_t lifecycle_phase(
    const bazaar::schema::product_state_t& product);

/// True once a consumer is chosen and the escrow still holds the payment.
bool escrow_locked(const bazaar::schema::product_state_t& product);

bool is_party(const bazaar::schema::product_state_t& product,
              const bazaar::schema::signer_id_t& principal);

}  // namespace bazaar::market
