#pragma once
#include <bazaar/schema/choose_consumer.hpp>
#include <bazaar/schema/confirm_order.hpp>
#include <bazaar/schema/create_product.hpp>
#include <bazaar/schema/file_complaint.hpp>
#include <bazaar/schema/order_product.hpp>
#include <bazaar/schema/primitives.hpp>
#include <bazaar/schema/resolve_dispute_for_consumer.hpp>
#include <bazaar/schema/resolve_dispute_for_supplier.hpp>
#include <bazaar/schema/submit_order.hpp>
#include <bazaar/schema/transfer_capability.hpp>
#include <bazaar/schema/transfer_funds.hpp>
#include <variant>

namespace bazaar::schema {

using transaction_payload_t = std::variant<create_product_t,
                                           order_product_t,
                                           choose_consumer_t,
                                           submit_order_t,
                                           confirm_order_t,
                                           file_complaint_t,
                                           resolve_dispute_for_consumer_t,
                                           resolve_dispute_for_supplier_t,
                                           transfer_funds_t,
                                           transfer_capability_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace bazaar::schema
