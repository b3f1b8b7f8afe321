#pragma once
#include <bazaar/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bazaar::storage {

using key_value_entry_t =
    std::pair<bazaar::schema::bytes_t, bazaar::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  bazaar::schema::hash32_t state_root;
};

/// Ordered set of puts and deletes applied all-or-nothing.
///
/// A transaction stages every write here and hands the batch to storage
/// only after all of its preconditions held.
struct write_batch final {
  struct operation final {
    bazaar::schema::bytes_t key;
    std::optional<bazaar::schema::bytes_t> value;  // nullopt deletes
  };

  std::vector<operation> operations;

  template <typename Encoder, typename T>
  void put(Encoder& encoder, bazaar::schema::bytes_t key, const T& value) {
    operations.push_back(
        operation{.key = std::move(key), .value = encoder.encode(value)});
  }

  void erase(bazaar::schema::bytes_t key) {
    operations.push_back(
        operation{.key = std::move(key), .value = std::nullopt});
  }

  bool empty() const { return operations.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bazaar::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bazaar::schema::bytes_view_t& key,
           const T& value) const;

  /// Apply every operation of the batch atomically.
  void write(const write_batch& batch) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bazaar::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bazaar::storage
