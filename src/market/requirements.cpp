#include <bazaar/market/requirements.hpp>

#include <algorithm>
#include <set>

namespace bazaar::market {

std::optional<requirement_rule> find_requirement_rule(
    const std::string_view tag) {
  auto found = std::ranges::find(kRequirementRules, tag, &requirement_rule::tag);
  if (found == std::end(kRequirementRules)) {
    return std::nullopt;
  }
  return *found;
}

bool requirements_satisfied(const uint32_t quality,
                            const std::vector<std::string>& requirements) {
  return std::ranges::all_of(requirements, [&](const std::string& tag) {
    auto rule = find_requirement_rule(tag);
    return !rule.has_value() || quality >= rule->minimum_quality;
  });
}

bool has_duplicate_requirements(const std::vector<std::string>& requirements) {
  auto seen = std::set<std::string_view>{};
  for (const auto& tag : requirements) {
    if (!seen.insert(tag).second) {
      return true;
    }
  }
  return false;
}

}  // namespace bazaar::market
