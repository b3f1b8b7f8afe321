#pragma once

#include <bazaar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: transaction error code.
// Marketplace workflow: stable rejection taxonomy. Envelope errors occupy
// 1-9, authorization 10-19, lifecycle state 20-39, timing 40-49 and value
// errors 50-59. Numbers never change once released.
namespace bazaar::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,

  capability_missing = 10,
  invalid_capability = 11,
  wrong_address = 12,
  incorrect_supplier = 13,

  product_missing = 20,
  out_of_stock = 21,
  duplicate_bid = 22,
  no_such_bid = 23,
  order_not_submitted = 24,
  consumer_not_selected = 25,
  dispute_false = 26,
  dispute_already_open = 27,
  dispute_open = 28,
  product_settled = 29,
  escrow_empty = 30,
  complaint_missing = 31,
  complaint_mismatch = 32,

  deadline_expired = 40,
  deadline_not_reached = 41,

  invalid_product_parameters = 50,
  requirements_not_met = 51,
  duplicate_requirement = 52,
  insufficient_funds = 53,
  insufficient_balance = 54,
  invalid_transfer = 55,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    enum_mapping_t<transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    enum_mapping_t<transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    enum_mapping_t<transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    enum_mapping_t<transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    enum_mapping_t<transaction_error_code>{
        "invalid_signature_type",
        transaction_error_code::invalid_signature_type},
    enum_mapping_t<transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    enum_mapping_t<transaction_error_code>{
        "capability_missing", transaction_error_code::capability_missing},
    enum_mapping_t<transaction_error_code>{
        "invalid_capability", transaction_error_code::invalid_capability},
    enum_mapping_t<transaction_error_code>{
        "wrong_address", transaction_error_code::wrong_address},
    enum_mapping_t<transaction_error_code>{
        "incorrect_supplier", transaction_error_code::incorrect_supplier},
    enum_mapping_t<transaction_error_code>{
        "product_missing", transaction_error_code::product_missing},
    enum_mapping_t<transaction_error_code>{
        "out_of_stock", transaction_error_code::out_of_stock},
    enum_mapping_t<transaction_error_code>{
        "duplicate_bid", transaction_error_code::duplicate_bid},
    enum_mapping_t<transaction_error_code>{
        "no_such_bid", transaction_error_code::no_such_bid},
    enum_mapping_t<transaction_error_code>{
        "order_not_submitted", transaction_error_code::order_not_submitted},
    enum_mapping_t<transaction_error_code>{
        "consumer_not_selected",
        transaction_error_code::consumer_not_selected},
    enum_mapping_t<transaction_error_code>{
        "dispute_false", transaction_error_code::dispute_false},
    enum_mapping_t<transaction_error_code>{
        "dispute_already_open", transaction_error_code::dispute_already_open},
    enum_mapping_t<transaction_error_code>{
        "dispute_open", transaction_error_code::dispute_open},
    enum_mapping_t<transaction_error_code>{
        "product_settled", transaction_error_code::product_settled},
    enum_mapping_t<transaction_error_code>{
        "escrow_empty", transaction_error_code::escrow_empty},
    enum_mapping_t<transaction_error_code>{
        "complaint_missing", transaction_error_code::complaint_missing},
    enum_mapping_t<transaction_error_code>{
        "complaint_mismatch", transaction_error_code::complaint_mismatch},
    enum_mapping_t<transaction_error_code>{
        "deadline_expired", transaction_error_code::deadline_expired},
    enum_mapping_t<transaction_error_code>{
        "deadline_not_reached", transaction_error_code::deadline_not_reached},
    enum_mapping_t<transaction_error_code>{
        "invalid_product_parameters",
        transaction_error_code::invalid_product_parameters},
    enum_mapping_t<transaction_error_code>{
        "requirements_not_met", transaction_error_code::requirements_not_met},
    enum_mapping_t<transaction_error_code>{
        "duplicate_requirement",
        transaction_error_code::duplicate_requirement},
    enum_mapping_t<transaction_error_code>{
        "insufficient_funds", transaction_error_code::insufficient_funds},
    enum_mapping_t<transaction_error_code>{
        "insufficient_balance", transaction_error_code::insufficient_balance},
    enum_mapping_t<transaction_error_code>{
        "invalid_transfer", transaction_error_code::invalid_transfer},
};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings, "unknown_error");
}

}  // namespace bazaar::schema
