#pragma once
#include <bazaar/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace bazaar::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const bazaar::schema::bytes_view_t& bytes);

  /// Digest of everything fed so far. The hasher stays usable.
  bazaar::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

bazaar::schema::hash32_t hash(const std::string_view& str);
bazaar::schema::hash32_t hash(const bazaar::schema::bytes_view_t& bytes);

}  // namespace bazaar::blake3
