#pragma once
#include <bazaar/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: complaint state.
// Marketplace workflow: dispute ticket opened after the deadline. `decision`
// stays false until an arbitrator resolves the dispute for the consumer.
namespace bazaar::schema {

template <uint16_t Version>
struct complaint_state;

template <>
struct complaint_state<1> final {
  uint16_t version{1};
  object_id_t complaint_id{};
  object_id_t product_id{};
  signer_id_t consumer{};
  signer_id_t supplier{};
  signer_id_t filed_by{};
  std::string reason;
  bool decision{};
  bool resolved{};
  timestamp_milliseconds_t filed_at{};
  std::optional<timestamp_milliseconds_t> resolved_at;
};

using complaint_state_t = complaint_state<1>;

}  // namespace bazaar::schema
