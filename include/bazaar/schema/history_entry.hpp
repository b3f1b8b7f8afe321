#pragma once

#include <bazaar/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Marketplace workflow: audit row. Raw transaction bytes and result code
// for every transaction in every finalized block, accepted or not.
namespace bazaar::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  uint32_t code{};
  timestamp_milliseconds_t block_time{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace bazaar::schema
