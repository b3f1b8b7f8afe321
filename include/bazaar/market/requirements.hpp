#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bazaar::market {

/// A declared bid tag and the minimum product quality it demands.
struct requirement_rule final {
  std::string_view tag;
  uint32_t minimum_quality{};
};

/// Upper bound of the quality score when range enforcement is on.
inline constexpr auto kMaximumQuality = uint32_t{100};

inline constexpr auto kHighQualityTag = std::string_view{"high_quality"};
inline constexpr auto kHighQualityThreshold = uint32_t{80};

// Tags without an entry impose no constraint.
inline constexpr auto kRequirementRules = std::array{
    requirement_rule{.tag = kHighQualityTag,
                     .minimum_quality = kHighQualityThreshold}};

std::optional<requirement_rule> find_requirement_rule(std::string_view tag);

/// True when every tag in `requirements` is compatible with `quality`.
bool requirements_satisfied(uint32_t quality,
                            const std::vector<std::string>& requirements);

bool has_duplicate_requirements(const std::vector<std::string>& requirements);

}  // namespace bazaar::market
