#pragma once

#include <bazaar/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace bazaar::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"bazaar-escrow"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  int64_t last_block_height{};
  hash32_t last_block_state_root;
  hash32_t chain_id;
};

using app_info_t = app_info<1>;

}  // namespace bazaar::schema
