#pragma once

#include <bazaar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: capability kind.
// Marketplace workflow: distinguishes per-product supplier tokens from the
// single arbitrator token minted at bootstrap.
namespace bazaar::schema {

enum class capability_kind_t : uint8_t { product = 0, admin = 1 };

inline constexpr auto kCapabilityKindMappings = enum_mappings_t<
    capability_kind_t, 2>{
    enum_mapping_t<capability_kind_t>{"product", capability_kind_t::product},
    enum_mapping_t<capability_kind_t>{"admin", capability_kind_t::admin}};

template <>
inline std::optional<capability_kind_t> try_from_string<capability_kind_t>(
    const std::string_view value) {
  return from_string(value, kCapabilityKindMappings);
}

inline constexpr std::string_view to_string(const capability_kind_t value) {
  return to_string(value, kCapabilityKindMappings, "unknown");
}

}  // namespace bazaar::schema
