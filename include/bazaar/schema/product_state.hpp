#pragma once
#include <bazaar/schema/primitives.hpp>
#include <bazaar/schema/settlement.hpp>
#include <optional>
#include <string>

// Schema type: product state.
// Marketplace workflow: the listed lot. Holds the bid-table size, the
// selection flags and the escrowed payment. The bids themselves live in
// their own keyspace keyed by (product_id, bidder).
namespace bazaar::schema {

template <uint16_t Version>
struct product_state;

template <>
struct product_state<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  signer_id_t supplier{};
  std::string description;
  uint32_t quality{};
  amount_t price{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t deadline{};
  bool status{};
  std::optional<signer_id_t> consumer;
  bool order_submitted{};
  bool dispute{};
  amount_t payment{};
  uint32_t bid_count{};
  settlement_t settlement{settlement_t::none};
  std::optional<object_id_t> complaint_id;
};

using product_state_t = product_state<1>;

}  // namespace bazaar::schema
