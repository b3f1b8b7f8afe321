#pragma once
#include <bazaar/common/critical.hpp>
#include <bazaar/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema records are plain aggregates; the SCALE codec walks their fields in
// declaration order, so field order is part of the wire format.
namespace bazaar::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bazaar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bazaar::schema::bytes_t& out);

  template <typename T>
  T decode(const bazaar::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bazaar::schema::bytes_view_t& bytes);
};

template <typename T>
bazaar::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    bazaar::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        bazaar::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const bazaar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    bazaar::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bazaar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace bazaar::schema::encoding
