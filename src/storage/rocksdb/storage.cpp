#include <bazaar/common/critical.hpp>
#include <bazaar/storage/rocksdb/storage.hpp>

namespace bazaar::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    bazaar::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB object store at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    bazaar::common::critical("RocksDB database is not initialized");
  }
}

void storage<rocksdb_storage_tag>::write(const write_batch& batch) const {
  require_open();
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& operation : batch.operations) {
    auto key = detail::to_slice(operation.key);
    auto status = operation.value.has_value()
                      ? rocks_batch.Put(key, detail::to_slice(*operation.value))
                      : rocks_batch.Delete(key);
    if (!status.ok()) {
      spdlog::error("Failed staging batch operation: {}", status.ToString());
      bazaar::common::critical("failed staging write batch");
    }
  }

  auto status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch: {}", status.ToString());
    bazaar::common::critical("failed to commit write batch");
  }
  spdlog::debug("Committed write batch with {} operation(s)",
                batch.operations.size());
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    bazaar::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, bazaar::schema::hash32_t>>(
          bazaar::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    bazaar::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_open();
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedStateKey},
      detail::to_slice(
          bazaar::schema::bytes_view_t{encoded.data(), encoded.size()}));
  if (!status.ok()) {
    bazaar::common::critical("failed to persist committed state");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bazaar::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    bazaar::common::critical("failed listing keys by prefix");
  }
  return entries;
}

}  // namespace bazaar::storage
