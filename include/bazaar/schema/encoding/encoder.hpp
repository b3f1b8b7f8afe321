#pragma once
#include <bazaar/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bazaar::schema::encoding {

/// Build-time codec seam. `Library` is a tag selecting the wire format; the
/// only one shipped is `scale_encoder_tag`.
template <typename Library>
struct encoder {
  template <typename T>
  bazaar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bazaar::schema::bytes_t& out);

  template <typename T>
  T decode(const bazaar::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bazaar::schema::bytes_view_t& bytes);
};

}  // namespace bazaar::schema::encoding
