#pragma once

#include <bazaar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: settlement.
// Marketplace workflow: records which release path drained a product's
// escrow. Anything other than `none` means the escrow fill is spent.
namespace bazaar::schema {

enum class settlement_t : uint8_t {
  none = 0,
  confirmed = 1,
  resolved_for_consumer = 2,
  resolved_for_supplier = 3
};

inline constexpr auto kSettlementMappings = enum_mappings_t<settlement_t, 4>{
    enum_mapping_t<settlement_t>{"none", settlement_t::none},
    enum_mapping_t<settlement_t>{"confirmed", settlement_t::confirmed},
    enum_mapping_t<settlement_t>{"resolved_for_consumer",
                                 settlement_t::resolved_for_consumer},
    enum_mapping_t<settlement_t>{"resolved_for_supplier",
                                 settlement_t::resolved_for_supplier}};

template <>
inline std::optional<settlement_t> try_from_string<settlement_t>(
    const std::string_view value) {
  return from_string(value, kSettlementMappings);
}

inline constexpr std::string_view to_string(const settlement_t value) {
  return to_string(value, kSettlementMappings, "unknown");
}

}  // namespace bazaar::schema
