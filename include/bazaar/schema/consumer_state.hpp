#pragma once
#include <bazaar/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: consumer state.
// Marketplace workflow: a pending bid. Owned by the product's bid table
// until the supplier selects it, at which point it is removed and handed
// back in the selection result.
namespace bazaar::schema {

template <uint16_t Version>
struct consumer_state;

template <>
struct consumer_state<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  signer_id_t bidder{};
  std::string description;
  std::vector<std::string> requirements;  // ordered, no duplicates
  timestamp_milliseconds_t submitted_at{};
};

using consumer_state_t = consumer_state<1>;

}  // namespace bazaar::schema
