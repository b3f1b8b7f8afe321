#include <spdlog/spdlog.h>
#include <algorithm>
#include <bazaar/blake3/hash.hpp>
#include <bazaar/common/critical.hpp>
#include <bazaar/crypto/verify.hpp>
#include <bazaar/execution/engine.hpp>
#include <bazaar/execution/results.hpp>
#include <bazaar/schema/encoding/scale/encoder.hpp>
#include <bazaar/schema/key/engine_keys.hpp>
#include <bazaar/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace bazaar::schema;

namespace {

using encoder_t = bazaar::schema::encoding::encoder<
    bazaar::schema::encoding::scale_encoder_tag>;

inline constexpr auto kQueryCodespace = std::string_view{"bazaar.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const hash32_t& tx_digest,
                         const uint64_t height,
                         const uint64_t index) {
  auto encoder = encoder_t{};
  const auto suffix = encoder.encode(std::tuple{height, index});
  return bazaar::blake3::hasher{}
      .update(bytes_view_t{seed.data(), seed.size()})
      .update(bytes_view_t{tx_digest.data(), tx_digest.size()})
      .update(bytes_view_t{suffix.data(), suffix.size()})
      .finalize();
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::optional<transaction_t> decode_transaction(encoder_t& encoder,
                                                const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

}  // namespace

namespace bazaar::execution {

engine::engine(
    bazaar::schema::encoding::encoder<
        bazaar::schema::encoding::scale_encoder_tag>& encoder,
    bazaar::storage::storage<bazaar::storage::rocksdb_storage_tag>& storage,
    const genesis_t& genesis,
    const bool require_strict_crypto,
    const bool enforce_quality_range)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      enforce_quality_range_{enforce_quality_range},
      signature_verifier_{crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !crypto::available()) {
    spdlog::warn("Strict crypto requested but Ed25519 is unavailable");
  }
  load_persisted_state();
  bootstrap(genesis);
  if (!enforce_quality_range_) {
    spdlog::warn("Quality range enforcement disabled");
  }
  spdlog::info("Execution engine ready at height {} on chain {}",
               last_committed_height_,
               to_hex(bytes_view_t{chain_id_.data(), chain_id_.size()}));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      decode_error, kCheckCodespace);
  }
  return validate_transaction(*maybe_tx, kCheckCodespace);
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time_ms,
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (std::size_t i = 0; i < txs.size(); ++i) {
    const auto raw_tx = bytes_view_t{txs[i].data(), txs[i].size()};
    const auto index = static_cast<uint32_t>(i);
    auto tx_result = transaction_result_t{};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
    if (!maybe_tx) {
      tx_result = make_error(transaction_error_code::invalid_transaction,
                             decode_error, kExecuteCodespace);
    } else {
      tx_result = validate_transaction(*maybe_tx, kExecuteCodespace);
      if (tx_result.code == 0) {
        auto context = transaction_context{.tx = *maybe_tx,
                                           .digest = blake3::hash(raw_tx),
                                           .now = block_time_ms,
                                           .allocated_objects = 0,
                                           .batch = {}};
        tx_result = execute_operation(context);
        if (tx_result.code == 0) {
          context.batch.put(encoder_,
                            key::make_nonce_key(encoder_, maybe_tx->signer),
                            maybe_tx->nonce);
          storage_.write(context.batch);
          rolling_root =
              fold_state_root(rolling_root, context.digest, height, index);
        }
      }
    }

    if (tx_result.code != 0) {
      spdlog::warn("Transaction {} at height {} rejected: {} ({})", index,
                   height, tx_result.log, tx_result.info);
    }
    storage_.put(encoder_, key::make_history_key(encoder_, height, index),
                 history_entry_t{.height = height,
                                 .index = index,
                                 .code = tx_result.code,
                                 .block_time = block_time_ms,
                                 .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }
  storage_.save_committed_state(bazaar::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = chain_id_;
  return result;
}

hash32_t engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

object_id_t engine::admin_cap_id() const {
  auto lock = std::scoped_lock{mutex_};
  return admin_cap_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier: strict crypto disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};

  const auto found = [&](const auto& value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(value);
    result.height = last_committed_height_;
    result.codespace = std::string{kQueryCodespace};
    return result;
  };
  const auto found_or_missing = [&](const auto& maybe_value,
                                    const std::string_view what) {
    if (!maybe_value) {
      return make_query_error(query_error_code::not_found,
                              fmt::format("{} not found", what), data);
    }
    return found(*maybe_value);
  };
  const auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key,
                            fmt::format("invalid key for {}", path), data);
  };

  if (path == "/engine/info") {
    return found(std::tuple{last_committed_height_, last_committed_state_root_,
                            chain_id_, admin_cap_id_});
  }
  if (path == "/account") {
    auto owner = encoder_.try_decode<signer_id_t>(data);
    if (!owner) {
      return invalid_key();
    }
    return found(load_account(*owner));
  }
  if (path == "/account/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key();
    }
    return found(load_nonce(*signer));
  }
  if (path == "/product") {
    auto product_id = encoder_.try_decode<object_id_t>(data);
    if (!product_id) {
      return invalid_key();
    }
    return found_or_missing(load_product(*product_id), "product");
  }
  if (path == "/product/bids") {
    auto product_id = encoder_.try_decode<object_id_t>(data);
    if (!product_id) {
      return invalid_key();
    }
    if (!load_product(*product_id)) {
      return make_query_error(query_error_code::not_found, "product not found",
                              data);
    }
    const auto prefix = key::make_bid_prefix(encoder_, *product_id);
    auto bids = std::vector<consumer_state_t>{};
    for (const auto& [bid_key, bid_value] : storage_.list_by_prefix(
             bytes_view_t{prefix.data(), prefix.size()})) {
      bids.push_back(encoder_.decode<consumer_state_t>(
          bytes_view_t{bid_value.data(), bid_value.size()}));
    }
    return found(bids);
  }
  if (path == "/product/bid") {
    auto bid_key =
        encoder_.try_decode<std::tuple<object_id_t, signer_id_t>>(data);
    if (!bid_key) {
      return invalid_key();
    }
    return found_or_missing(
        load_bid(std::get<0>(*bid_key), std::get<1>(*bid_key)), "bid");
  }
  if (path == "/capability") {
    auto cap_id = encoder_.try_decode<object_id_t>(data);
    if (!cap_id) {
      return invalid_key();
    }
    return found_or_missing(load_capability(*cap_id), "capability");
  }
  if (path == "/complaint") {
    auto complaint_id = encoder_.try_decode<object_id_t>(data);
    if (!complaint_id) {
      return invalid_key();
    }
    return found_or_missing(load_complaint(*complaint_id), "complaint");
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return invalid_key();
    }
    return found(collect_history(std::get<0>(*range), std::get<1>(*range)));
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          fmt::format("unsupported path {}", path), data);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return collect_history(from_height, to_height);
}

std::vector<history_entry_t> engine::collect_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  const auto prefix = key::make_prefix_key(encoder_, key::kHistoryPrefix);
  auto out = std::vector<history_entry_t>{};
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto entry = encoder_.decode<history_entry_t>(
        bytes_view_t{row_value.data(), row_value.size()});
    if (entry.height >= from_height && entry.height <= to_height) {
      out.push_back(std::move(entry));
    }
  }
  // Keys carry little-endian heights, so byte order is not block order.
  std::sort(std::begin(out), std::end(out),
            [](const history_entry_t& lhs, const history_entry_t& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return out;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "transaction chain id does not match", codespace);
  }
  const auto expected_nonce = load_nonce(tx.signer) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error(transaction_error_code::invalid_nonce,
                      fmt::format("expected nonce {}, got {}", expected_nonce,
                                  tx.nonce),
                      codespace);
  }
  if (require_strict_crypto_) {
    if (!std::holds_alternative<ed25519_signer_id>(tx.signer)) {
      return make_error(transaction_error_code::invalid_signature_type,
                        "named signers cannot sign in strict mode", codespace);
    }
    const auto message = signing_payload(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return make_error(transaction_error_code::signature_verification_failed,
                        "signature does not verify", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(transaction_context& context) {
  spdlog::debug("Executing payload {} from {}", context.tx.payload.index(),
                to_string(context.tx.signer));
  return std::visit(
      overloaded{[&](const create_product_t& payload) {
                   return create_product(context, payload);
                 },
                 [&](const order_product_t& payload) {
                   return order_product(context, payload);
                 },
                 [&](const choose_consumer_t& payload) {
                   return choose_consumer(context, payload);
                 },
                 [&](const submit_order_t& payload) {
                   return submit_order(context, payload);
                 },
                 [&](const confirm_order_t& payload) {
                   return confirm_order(context, payload);
                 },
                 [&](const file_complaint_t& payload) {
                   return file_complaint(context, payload);
                 },
                 [&](const resolve_dispute_for_consumer_t& payload) {
                   return resolve_dispute(context, payload.product_id,
                                          payload.complaint_id,
                                          payload.admin_cap_id, true);
                 },
                 [&](const resolve_dispute_for_supplier_t& payload) {
                   return resolve_dispute(context, payload.product_id,
                                          payload.complaint_id,
                                          payload.admin_cap_id, false);
                 },
                 [&](const transfer_funds_t& payload) {
                   return transfer_funds(context, payload);
                 },
                 [&](const transfer_capability_t& payload) {
                   return transfer_capability(context, payload);
                 }},
      context.tx.payload);
}

std::optional<transaction_error_code> engine::check_capability(
    const object_id_t& cap_id,
    const capability_kind_t kind,
    const object_id_t& product_id,
    const signer_id_t& signer) const {
  const auto capability = load_capability(cap_id);
  if (!capability) {
    return transaction_error_code::capability_missing;
  }
  if (capability->kind != kind || capability->owner != signer) {
    return transaction_error_code::invalid_capability;
  }
  if (kind == capability_kind_t::product &&
      capability->product_id != product_id) {
    return transaction_error_code::invalid_capability;
  }
  return std::nullopt;
}

object_id_t engine::allocate_object_id(transaction_context& context) const {
  const auto material =
      encoder_.encode(std::tuple{context.digest, context.allocated_objects});
  ++context.allocated_objects;
  return blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<product_state_t> engine::load_product(
    const object_id_t& product_id) const {
  const auto storage_key = key::make_product_key(encoder_, product_id);
  return storage_.get<product_state_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
}

std::optional<capability_state_t> engine::load_capability(
    const object_id_t& cap_id) const {
  const auto storage_key = key::make_capability_key(encoder_, cap_id);
  return storage_.get<capability_state_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
}

std::optional<complaint_state_t> engine::load_complaint(
    const object_id_t& complaint_id) const {
  const auto storage_key = key::make_complaint_key(encoder_, complaint_id);
  return storage_.get<complaint_state_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
}

std::optional<consumer_state_t> engine::load_bid(
    const object_id_t& product_id,
    const signer_id_t& bidder) const {
  const auto storage_key = key::make_bid_key(encoder_, product_id, bidder);
  return storage_.get<consumer_state_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
}

account_state_t engine::load_account(const signer_id_t& owner) const {
  const auto storage_key = key::make_account_key(encoder_, owner);
  auto account = storage_.get<account_state_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
  if (!account) {
    return account_state_t{.owner = owner, .balance = amount_t{}};
  }
  return *account;
}

uint64_t engine::load_nonce(const signer_id_t& signer) const {
  const auto storage_key = key::make_nonce_key(encoder_, signer);
  return storage_
      .get<uint64_t>(encoder_,
                     bytes_view_t{storage_key.data(), storage_key.size()})
      .value_or(0);
}

void engine::bootstrap(const genesis_t& genesis) {
  const auto chain_key = key::make_chain_id_key(encoder_);
  const auto admin_key = key::make_admin_cap_key(encoder_);
  if (auto stored = storage_.get<hash32_t>(
          encoder_, bytes_view_t{chain_key.data(), chain_key.size()})) {
    chain_id_ = *stored;
    auto stored_admin_cap = storage_.get<object_id_t>(
        encoder_, bytes_view_t{admin_key.data(), admin_key.size()});
    if (!stored_admin_cap) {
      bazaar::common::critical("chain id present without an admin capability");
    }
    admin_cap_id_ = *stored_admin_cap;
    spdlog::info("Resuming existing chain; genesis '{}' ignored",
                 genesis.chain_name);
    return;
  }

  chain_id_ = blake3::hash(std::string_view{genesis.chain_name});
  admin_cap_id_ = blake3::hasher{}
                      .update(bytes_view_t{chain_id_.data(), chain_id_.size()})
                      .update(std::string_view{"admin-capability"})
                      .finalize();

  auto batch = bazaar::storage::write_batch{};
  batch.put(encoder_, chain_key, chain_id_);
  batch.put(encoder_, admin_key, admin_cap_id_);
  batch.put(encoder_, key::make_capability_key(encoder_, admin_cap_id_),
            capability_state_t{.cap_id = admin_cap_id_,
                               .kind = capability_kind_t::admin,
                               .product_id = make_zero_hash(),
                               .owner = genesis.admin});

  auto accounts = std::vector<account_state_t>{};
  for (const auto& [owner, amount] : genesis.allocations) {
    auto existing = std::find_if(
        std::begin(accounts), std::end(accounts),
        [&](const account_state_t& account) { return account.owner == owner; });
    if (existing == std::end(accounts)) {
      accounts.push_back(account_state_t{.owner = owner, .balance = amount});
    } else {
      existing->balance += amount;
    }
  }
  for (const auto& account : accounts) {
    batch.put(encoder_, key::make_account_key(encoder_, account.owner),
              account);
  }
  storage_.write(batch);
  spdlog::info("Bootstrapped chain '{}': admin capability minted to {}, {} "
               "funded account(s)",
               genesis.chain_name, to_string(genesis.admin), accounts.size());
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;
}

}  // namespace bazaar::execution
