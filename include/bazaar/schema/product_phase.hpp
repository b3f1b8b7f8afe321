#pragma once

#include <bazaar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: product phase.
// Marketplace workflow: lifecycle view derived from a product record,
// listed -> bidding_open -> selected -> submitted -> confirmed, or into
// disputed and one of the two resolutions.
namespace bazaar::schema {

enum class product_phase_t : uint8_t {
  listed = 0,
  bidding_open = 1,
  selected = 2,
  submitted = 3,
  confirmed = 4,
  disputed = 5,
  resolved_for_consumer = 6,
  resolved_for_supplier = 7
};

inline constexpr auto kProductPhaseMappings =
    enum_mappings_t<product_phase_t, 8>{
        enum_mapping_t<product_phase_t>{"listed", product_phase_t::listed},
        enum_mapping_t<product_phase_t>{"bidding_open",
                                        product_phase_t::bidding_open},
        enum_mapping_t<product_phase_t>{"selected", product_phase_t::selected},
        enum_mapping_t<product_phase_t>{"submitted",
                                        product_phase_t::submitted},
        enum_mapping_t<product_phase_t>{"confirmed",
                                        product_phase_t::confirmed},
        enum_mapping_t<product_phase_t>{"disputed", product_phase_t::disputed},
        enum_mapping_t<product_phase_t>{
            "resolved_for_consumer", product_phase_t::resolved_for_consumer},
        enum_mapping_t<product_phase_t>{
            "resolved_for_supplier", product_phase_t::resolved_for_supplier}};

template <>
inline std::optional<product_phase_t> try_from_string<product_phase_t>(
    const std::string_view value) {
  return from_string(value, kProductPhaseMappings);
}

inline constexpr std::string_view to_string(const product_phase_t value) {
  return to_string(value, kProductPhaseMappings, "unknown");
}

}  // namespace bazaar::schema
