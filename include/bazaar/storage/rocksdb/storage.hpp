#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bazaar/common/critical.hpp>
#include <bazaar/schema/encoding/scale/encoder.hpp>
#include <bazaar/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace bazaar::storage {

namespace detail {

using encoder_t = bazaar::schema::encoding::encoder<
    bazaar::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bazaar::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bazaar::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bazaar::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bazaar::schema::bytes_view_t& key,
           const T& value) const;

  void write(const write_batch& batch) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bazaar::schema::bytes_view_t& prefix) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bazaar::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    bazaar::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(bazaar::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const bazaar::schema::bytes_view_t& key,
                                       const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(bazaar::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    bazaar::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace bazaar::storage
