#pragma once

#include <bazaar/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Marketplace workflow: canonical key prefixes and key builders for the
// object store (products, bids, capabilities, complaints, accounts) and the
// audit history.
namespace bazaar::schema::key {

inline constexpr std::string_view kChainIdKey{"SYS|APP|CHAIN_ID"};
inline constexpr std::string_view kAdminCapKey{"SYS|APP|ADMIN_CAP"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kProductKeyPrefix{"SYS|STATE|PRODUCT|"};
inline constexpr std::string_view kBidKeyPrefix{"SYS|STATE|BID|"};
inline constexpr std::string_view kCapabilityKeyPrefix{
    "SYS|STATE|CAPABILITY|"};
inline constexpr std::string_view kComplaintKeyPrefix{"SYS|STATE|COMPLAINT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

template <typename Encoder, typename T>
bazaar::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so a key
  // built from a tuple shares its leading bytes with the key of any prefix
  // of that tuple.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
bazaar::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
bazaar::schema::bytes_t make_chain_id_key(Encoder& encoder) {
  return make_prefix_key(encoder, kChainIdKey);
}

template <typename Encoder>
bazaar::schema::bytes_t make_admin_cap_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAdminCapKey);
}

template <typename Encoder>
bazaar::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const bazaar::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
bazaar::schema::bytes_t make_account_key(
    Encoder& encoder,
    const bazaar::schema::signer_id_t& owner) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, owner);
}

template <typename Encoder>
bazaar::schema::bytes_t make_product_key(
    Encoder& encoder,
    const bazaar::schema::object_id_t& product_id) {
  return make_prefixed_key(encoder, kProductKeyPrefix, product_id);
}

/// Prefix shared by every pending bid of one product.
template <typename Encoder>
bazaar::schema::bytes_t make_bid_prefix(
    Encoder& encoder,
    const bazaar::schema::object_id_t& product_id) {
  return make_prefixed_key(encoder, kBidKeyPrefix, product_id);
}

template <typename Encoder>
bazaar::schema::bytes_t make_bid_key(
    Encoder& encoder,
    const bazaar::schema::object_id_t& product_id,
    const bazaar::schema::signer_id_t& bidder) {
  return make_prefixed_key(encoder, kBidKeyPrefix,
                           std::tuple{product_id, bidder});
}

template <typename Encoder>
bazaar::schema::bytes_t make_capability_key(
    Encoder& encoder,
    const bazaar::schema::object_id_t& cap_id) {
  return make_prefixed_key(encoder, kCapabilityKeyPrefix, cap_id);
}

template <typename Encoder>
bazaar::schema::bytes_t make_complaint_key(
    Encoder& encoder,
    const bazaar::schema::object_id_t& complaint_id) {
  return make_prefixed_key(encoder, kComplaintKeyPrefix, complaint_id);
}

template <typename Encoder>
bazaar::schema::bytes_t make_history_key(Encoder& encoder,
                                         const uint64_t height,
                                         const uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

}  // namespace bazaar::schema::key
