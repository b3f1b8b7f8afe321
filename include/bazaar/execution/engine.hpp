#pragma once

#include <bazaar/execution/signature_verifier.hpp>
#include <bazaar/schema/account_state.hpp>
#include <bazaar/schema/app_info.hpp>
#include <bazaar/schema/block_result.hpp>
#include <bazaar/schema/capability_state.hpp>
#include <bazaar/schema/commit_result.hpp>
#include <bazaar/schema/complaint_state.hpp>
#include <bazaar/schema/consumer_state.hpp>
#include <bazaar/schema/encoding/encoder.hpp>
#include <bazaar/schema/genesis.hpp>
#include <bazaar/schema/history_entry.hpp>
#include <bazaar/schema/primitives.hpp>
#include <bazaar/schema/product_state.hpp>
#include <bazaar/schema/query_result.hpp>
#include <bazaar/schema/transaction.hpp>
#include <bazaar/schema/transaction_error_code.hpp>
#include <bazaar/schema/transaction_result.hpp>
#include <bazaar/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bazaar::execution {

/// Deterministic escrow marketplace state machine.
///
/// The engine validates transaction envelopes, applies marketplace payloads
/// atomically against the object store, records the audit history and
/// serves read queries. Every public entry point is serialized on one mutex.
class engine final {
 public:
  /// Open the engine over `storage`.
  ///
  /// On an empty store `genesis` is applied once: the chain id is derived
  /// from `genesis.chain_name`, the arbitrator capability is minted to
  /// `genesis.admin` and the opening balances are credited. A store that
  /// already carries a chain id ignores `genesis`.
  /// `require_strict_crypto` enables signature verification; when false
  /// signatures are not checked. `enforce_quality_range` rejects listings
  /// with a quality score above 100.
  explicit engine(
      bazaar::schema::encoding::encoder<
          bazaar::schema::encoding::scale_encoder_tag>& encoder,
      bazaar::storage::storage<bazaar::storage::rocksdb_storage_tag>& storage,
      const bazaar::schema::genesis_t& genesis,
      bool require_strict_crypto = true,
      bool enforce_quality_range = true);

  /// Decode and validate a transaction envelope without touching state.
  bazaar::schema::transaction_result_t check_transaction(
      const bazaar::schema::bytes_view_t& raw_tx);

  /// Apply a block of transactions in order at `block_time_ms`.
  ///
  /// Every transaction gets a result and a history row. Successful ones are
  /// folded into the pending state root.
  bazaar::schema::block_result_t finalize_block(
      uint64_t height,
      bazaar::schema::timestamp_milliseconds_t block_time_ms,
      const std::vector<bazaar::schema::bytes_t>& txs);

  /// Persist the last finalized height and state root.
  bazaar::schema::commit_result_t commit();

  bazaar::schema::app_info_t info() const;

  /// Read-path query by route: `/engine/info`, `/account`, `/account/nonce`,
  /// `/product`, `/product/bids`, `/product/bid`, `/capability`,
  /// `/complaint` and `/history/range`. `data` is the SCALE-encoded key.
  bazaar::schema::query_result_t query(
      std::string_view path,
      const bazaar::schema::bytes_view_t& data);

  /// History rows with `from_height <= height <= to_height`.
  std::vector<bazaar::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Replace the signature check. Ignored when strict crypto is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  bazaar::schema::hash32_t chain_id() const;
  bazaar::schema::object_id_t admin_cap_id() const;

 private:
  /// Per-transaction scratch state: the staged writes and the object-id
  /// allocator seeded by the transaction digest.
  struct transaction_context final {
    const bazaar::schema::transaction_t& tx;
    bazaar::schema::hash32_t digest;
    bazaar::schema::timestamp_milliseconds_t now{};
    uint32_t allocated_objects{};
    bazaar::storage::write_batch batch;
  };

  /// Envelope checks: version, chain id, nonce and signature.
  bazaar::schema::transaction_result_t validate_transaction(
      const bazaar::schema::transaction_t& tx,
      std::string_view codespace) const;

  bazaar::schema::transaction_result_t execute_operation(
      transaction_context& context);

  bazaar::schema::transaction_result_t create_product(
      transaction_context& context,
      const bazaar::schema::create_product_t& payload);
  bazaar::schema::transaction_result_t order_product(
      transaction_context& context,
      const bazaar::schema::order_product_t& payload);
  bazaar::schema::transaction_result_t choose_consumer(
      transaction_context& context,
      const bazaar::schema::choose_consumer_t& payload);
  bazaar::schema::transaction_result_t submit_order(
      transaction_context& context,
      const bazaar::schema::submit_order_t& payload);
  bazaar::schema::transaction_result_t confirm_order(
      transaction_context& context,
      const bazaar::schema::confirm_order_t& payload);
  bazaar::schema::transaction_result_t file_complaint(
      transaction_context& context,
      const bazaar::schema::file_complaint_t& payload);
  /// Shared body of both resolution payloads. `for_consumer` picks the
  /// escrow recipient.
  bazaar::schema::transaction_result_t resolve_dispute(
      transaction_context& context,
      const bazaar::schema::object_id_t& product_id,
      const bazaar::schema::object_id_t& complaint_id,
      const bazaar::schema::object_id_t& admin_cap_id,
      bool for_consumer);
  bazaar::schema::transaction_result_t transfer_funds(
      transaction_context& context,
      const bazaar::schema::transfer_funds_t& payload);
  bazaar::schema::transaction_result_t transfer_capability(
      transaction_context& context,
      const bazaar::schema::transfer_capability_t& payload);

  /// Possession check for a capability presented by `signer`. A product
  /// capability must also be bound to `product_id`.
  std::optional<bazaar::schema::transaction_error_code> check_capability(
      const bazaar::schema::object_id_t& cap_id,
      bazaar::schema::capability_kind_t kind,
      const bazaar::schema::object_id_t& product_id,
      const bazaar::schema::signer_id_t& signer) const;

  bazaar::schema::object_id_t allocate_object_id(
      transaction_context& context) const;

  std::optional<bazaar::schema::product_state_t> load_product(
      const bazaar::schema::object_id_t& product_id) const;
  std::optional<bazaar::schema::capability_state_t> load_capability(
      const bazaar::schema::object_id_t& cap_id) const;
  std::optional<bazaar::schema::complaint_state_t> load_complaint(
      const bazaar::schema::object_id_t& complaint_id) const;
  std::optional<bazaar::schema::consumer_state_t> load_bid(
      const bazaar::schema::object_id_t& product_id,
      const bazaar::schema::signer_id_t& bidder) const;
  /// Stored account, or a zero balance owned by `owner`.
  bazaar::schema::account_state_t load_account(
      const bazaar::schema::signer_id_t& owner) const;
  uint64_t load_nonce(const bazaar::schema::signer_id_t& signer) const;

  std::vector<bazaar::schema::history_entry_t> collect_history(
      uint64_t from_height,
      uint64_t to_height) const;

  void bootstrap(const bazaar::schema::genesis_t& genesis);
  void load_persisted_state();

  mutable std::mutex mutex_;
  bazaar::schema::encoding::encoder<
      bazaar::schema::encoding::scale_encoder_tag>& encoder_;
  bazaar::storage::storage<bazaar::storage::rocksdb_storage_tag>& storage_;
  int64_t last_committed_height_{};
  bazaar::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  bazaar::schema::hash32_t pending_state_root_{};
  bazaar::schema::hash32_t chain_id_{};
  bazaar::schema::object_id_t admin_cap_id_{};
  bool require_strict_crypto_{true};
  bool enforce_quality_range_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace bazaar::execution
