#pragma once

#include <bazaar/schema/transaction_error_code.hpp>
#include <bazaar/schema/transaction_event.hpp>
#include <bazaar/schema/transaction_result.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace bazaar::execution {

inline constexpr auto kCheckCodespace = std::string_view{"bazaar.checktx"};
inline constexpr auto kExecuteCodespace = std::string_view{"bazaar.execute"};

/// Failed result carrying the stable code, its name as `log` and detail as
/// `info`.
inline bazaar::schema::transaction_result_t make_error(
    const bazaar::schema::transaction_error_code code,
    std::string info,
    const std::string_view codespace = kExecuteCodespace) {
  auto result = bazaar::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{bazaar::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

/// Event with every attribute indexed.
inline bazaar::schema::transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string_view, std::string>>
        attributes) {
  auto event = bazaar::schema::transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(bazaar::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  return event;
}

}  // namespace bazaar::execution
