#include <bazaar/market/lifecycle.hpp>

#include <utility>

namespace bazaar::market {

using bazaar::schema::product_phase_t;
using bazaar::schema::settlement_t;

bazaar::schema::consumer_state_t new_consumer(
    const bazaar::schema::object_id_t& product_id,
    const bazaar::schema::signer_id_t& bidder,
    std::string description,
    const std::vector<std::string>& requirements) {
  return bazaar::schema::consumer_state_t{
      .product_id = product_id,
      .bidder = bidder,
      .description = std::move(description),
      .requirements = requirements,
      .submitted_at = 0};
}

product_phase_t lifecycle_phase(const bazaar::schema::product_state_t& product) {
  switch (product.settlement) {
    case settlement_t::confirmed:
      return product_phase_t::confirmed;
    case settlement_t::resolved_for_consumer:
      return product_phase_t::resolved_for_consumer;
    case settlement_t::resolved_for_supplier:
      return product_phase_t::resolved_for_supplier;
    case settlement_t::none:
      break;
  }
  if (product.dispute) {
    return product_phase_t::disputed;
  }
  if (product.status) {
    return product.order_submitted ? product_phase_t::submitted
                                   : product_phase_t::selected;
  }
  return product.bid_count > 0 ? product_phase_t::bidding_open
                               : product_phase_t::listed;
}

bool escrow_locked(const bazaar::schema::product_state_t& product) {
  return product.status && product.settlement == settlement_t::none &&
         product.payment > 0;
}

bool is_party(const bazaar::schema::product_state_t& product,
              const bazaar::schema::signer_id_t& principal) {
  return principal == product.supplier ||
         (product.consumer.has_value() && principal == *product.consumer);
}

}  // namespace bazaar::market
