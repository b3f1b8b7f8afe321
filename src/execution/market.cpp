#include <spdlog/spdlog.h>
#include <bazaar/escrow/coin.hpp>
#include <bazaar/execution/engine.hpp>
#include <bazaar/execution/results.hpp>
#include <bazaar/market/lifecycle.hpp>
#include <bazaar/market/requirements.hpp>
#include <bazaar/schema/encoding/scale/encoder.hpp>
#include <bazaar/schema/key/engine_keys.hpp>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace bazaar::schema;

namespace {

std::string hex(const hash32_t& id) {
  return to_hex(bytes_view_t{id.data(), id.size()});
}

}  // namespace

namespace bazaar::execution {

transaction_result_t engine::create_product(transaction_context& context,
                                            const create_product_t& payload) {
  if (payload.price == 0 || payload.duration == 0) {
    return make_error(transaction_error_code::invalid_product_parameters,
                      "price and duration must be positive");
  }
  if (enforce_quality_range_ && payload.quality > market::kMaximumQuality) {
    return make_error(transaction_error_code::invalid_product_parameters,
                      fmt::format("quality {} exceeds {}", payload.quality,
                                  market::kMaximumQuality));
  }
  if (payload.duration >
      std::numeric_limits<timestamp_milliseconds_t>::max() - context.now) {
    return make_error(transaction_error_code::invalid_product_parameters,
                      "deadline overflows the clock");
  }

  const auto& supplier = context.tx.signer;
  auto product = product_state_t{};
  product.product_id = allocate_object_id(context);
  product.supplier = supplier;
  product.description = payload.description;
  product.quality = payload.quality;
  product.price = payload.price;
  product.created_at = context.now;
  product.deadline = context.now + payload.duration;

  const auto capability =
      capability_state_t{.cap_id = allocate_object_id(context),
                         .kind = capability_kind_t::product,
                         .product_id = product.product_id,
                         .owner = supplier};

  context.batch.put(encoder_,
                    key::make_product_key(encoder_, product.product_id),
                    product);
  context.batch.put(encoder_,
                    key::make_capability_key(encoder_, capability.cap_id),
                    capability);

  auto result = transaction_result_t{};
  result.data =
      encoder_.encode(std::tuple{product.product_id, capability.cap_id});
  result.events.push_back(
      make_event("product_created",
                 {{"product_id", hex(product.product_id)},
                  {"cap_id", hex(capability.cap_id)},
                  {"supplier", to_string(supplier)},
                  {"price", product.price.str()},
                  {"deadline", std::to_string(product.deadline)}}));
  spdlog::info("Product {} listed by {} at price {} until {}",
               hex(product.product_id), to_string(supplier),
               product.price.str(), product.deadline);
  return result;
}

transaction_result_t engine::order_product(transaction_context& context,
                                           const order_product_t& payload) {
  auto product = load_product(payload.product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  if (product->status) {
    return make_error(transaction_error_code::out_of_stock,
                      "a consumer has already been chosen");
  }
  if (market::has_duplicate_requirements(payload.requirements)) {
    return make_error(transaction_error_code::duplicate_requirement,
                      "requirement tags must be unique");
  }
  if (!market::requirements_satisfied(product->quality,
                                      payload.requirements)) {
    return make_error(
        transaction_error_code::requirements_not_met,
        fmt::format("quality {} does not meet the requested tags",
                    product->quality));
  }
  const auto& bidder = context.tx.signer;
  if (load_bid(payload.product_id, bidder)) {
    return make_error(transaction_error_code::duplicate_bid,
                      "principal already has a pending bid");
  }

  auto bid = market::new_consumer(payload.product_id, bidder,
                                  payload.description, payload.requirements);
  bid.submitted_at = context.now;
  ++product->bid_count;

  context.batch.put(encoder_,
                    key::make_bid_key(encoder_, payload.product_id, bidder),
                    bid);
  context.batch.put(encoder_,
                    key::make_product_key(encoder_, payload.product_id),
                    *product);

  auto result = transaction_result_t{};
  result.events.push_back(make_event(
      "bid_submitted",
      {{"product_id", hex(payload.product_id)},
       {"bidder", to_string(bidder)},
       {"requirements", std::to_string(bid.requirements.size())}}));
  spdlog::debug("Bid from {} on product {}", to_string(bidder),
                hex(payload.product_id));
  return result;
}

transaction_result_t engine::choose_consumer(
    transaction_context& context,
    const choose_consumer_t& payload) {
  auto product = load_product(payload.product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  const auto& supplier = context.tx.signer;
  if (auto denied = check_capability(payload.cap_id, capability_kind_t::product,
                                     payload.product_id, supplier)) {
    return make_error(*denied, "signer does not hold this product capability");
  }
  if (product->status) {
    return make_error(transaction_error_code::out_of_stock,
                      "a consumer has already been chosen");
  }
  if (payload.payment < product->price) {
    return make_error(transaction_error_code::insufficient_funds,
                      fmt::format("payment {} is below price {}",
                                  payload.payment.str(), product->price.str()));
  }
  auto bid = load_bid(payload.product_id, payload.chosen);
  if (!bid) {
    return make_error(transaction_error_code::no_such_bid,
                      "chosen principal has no pending bid");
  }
  if (!market::requirements_satisfied(product->quality, bid->requirements)) {
    return make_error(transaction_error_code::requirements_not_met,
                      "bid requirements no longer fit the product");
  }

  auto account = load_account(supplier);
  auto payment = escrow::withdraw(account.balance, payload.payment);
  if (!payment) {
    return make_error(
        transaction_error_code::insufficient_balance,
        fmt::format("balance {} cannot cover payment {}",
                    account.balance.str(), payload.payment.str()));
  }
  escrow::deposit(product->payment, std::move(*payment));
  product->status = true;
  product->consumer = payload.chosen;
  --product->bid_count;

  context.batch.erase(
      key::make_bid_key(encoder_, payload.product_id, payload.chosen));
  context.batch.put(encoder_,
                    key::make_product_key(encoder_, payload.product_id),
                    *product);
  context.batch.put(encoder_, key::make_account_key(encoder_, supplier),
                    account);

  auto result = transaction_result_t{};
  result.data = encoder_.encode(*bid);
  result.events.push_back(
      make_event("consumer_chosen", {{"product_id", hex(payload.product_id)},
                                     {"consumer", to_string(payload.chosen)},
                                     {"escrow", product->payment.str()}}));
  spdlog::info("Product {} escrowed {} for consumer {}",
               hex(payload.product_id), product->payment.str(),
               to_string(payload.chosen));
  return result;
}

transaction_result_t engine::submit_order(transaction_context& context,
                                          const submit_order_t& payload) {
  auto product = load_product(payload.product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  if (context.now >= product->deadline) {
    return make_error(transaction_error_code::deadline_expired,
                      fmt::format("deadline {} has passed", product->deadline));
  }
  if (!product->consumer || *product->consumer != context.tx.signer) {
    return make_error(transaction_error_code::wrong_address,
                      "only the selected consumer may submit the order");
  }

  product->order_submitted = true;
  context.batch.put(encoder_,
                    key::make_product_key(encoder_, payload.product_id),
                    *product);

  auto result = transaction_result_t{};
  result.events.push_back(make_event(
      "order_submitted", {{"product_id", hex(payload.product_id)},
                          {"consumer", to_string(context.tx.signer)}}));
  return result;
}

transaction_result_t engine::confirm_order(transaction_context& context,
                                           const confirm_order_t& payload) {
  auto product = load_product(payload.product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  if (auto denied = check_capability(payload.cap_id, capability_kind_t::product,
                                     payload.product_id, context.tx.signer)) {
    return make_error(*denied, "signer does not hold this product capability");
  }
  if (!product->order_submitted) {
    return make_error(transaction_error_code::order_not_submitted,
                      "consumer has not submitted the order");
  }
  if (context.now >= product->deadline) {
    return make_error(transaction_error_code::deadline_expired,
                      fmt::format("deadline {} has passed", product->deadline));
  }
  if (product->dispute) {
    return make_error(transaction_error_code::dispute_open,
                      "a dispute is pending on this product");
  }
  auto released = escrow::withdraw_all(product->payment);
  if (!released) {
    return make_error(transaction_error_code::escrow_empty,
                      "escrow was already released");
  }

  const auto recipient = *product->consumer;
  const auto amount = released->amount();
  auto account = load_account(recipient);
  escrow::deposit(account.balance, std::move(*released));
  product->settlement = settlement_t::confirmed;

  context.batch.put(encoder_,
                    key::make_product_key(encoder_, payload.product_id),
                    *product);
  context.batch.put(encoder_, key::make_account_key(encoder_, recipient),
                    account);

  auto result = transaction_result_t{};
  result.events.push_back(
      make_event("escrow_released", {{"product_id", hex(payload.product_id)},
                                     {"recipient", to_string(recipient)},
                                     {"amount", amount.str()},
                                     {"settlement", "confirmed"}}));
  spdlog::info("Product {} confirmed; released {} to {}",
               hex(payload.product_id), amount.str(), to_string(recipient));
  return result;
}

transaction_result_t engine::file_complaint(transaction_context& context,
                                            const file_complaint_t& payload) {
  auto product = load_product(payload.product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  if (context.now <= product->deadline) {
    return make_error(
        transaction_error_code::deadline_not_reached,
        fmt::format("complaints open after {}", product->deadline));
  }
  if (!product->consumer) {
    return make_error(transaction_error_code::consumer_not_selected,
                      "no consumer was ever chosen");
  }
  const auto& complainant = context.tx.signer;
  if (!market::is_party(*product, complainant)) {
    return make_error(transaction_error_code::incorrect_supplier,
                      "only the supplier or the consumer may complain");
  }
  if (!market::escrow_locked(*product)) {
    return make_error(transaction_error_code::product_settled,
                      "escrow was already released");
  }
  if (product->dispute) {
    return make_error(transaction_error_code::dispute_already_open,
                      "a dispute is already pending");
  }

  auto complaint = complaint_state_t{};
  complaint.complaint_id = allocate_object_id(context);
  complaint.product_id = payload.product_id;
  complaint.consumer = *product->consumer;
  complaint.supplier = product->supplier;
  complaint.filed_by = complainant;
  complaint.reason = payload.reason;
  complaint.filed_at = context.now;

  product->dispute = true;
  product->complaint_id = complaint.complaint_id;

  context.batch.put(encoder_,
                    key::make_complaint_key(encoder_, complaint.complaint_id),
                    complaint);
  context.batch.put(encoder_,
                    key::make_product_key(encoder_, payload.product_id),
                    *product);

  auto result = transaction_result_t{};
  result.data = encoder_.encode(complaint.complaint_id);
  result.events.push_back(make_event(
      "complaint_filed", {{"product_id", hex(payload.product_id)},
                          {"complaint_id", hex(complaint.complaint_id)},
                          {"filed_by", to_string(complainant)}}));
  spdlog::info("Dispute {} opened on product {} by {}",
               hex(complaint.complaint_id), hex(payload.product_id),
               to_string(complainant));
  return result;
}

transaction_result_t engine::resolve_dispute(
    transaction_context& context,
    const object_id_t& product_id,
    const object_id_t& complaint_id,
    const object_id_t& admin_cap_id,
    const bool for_consumer) {
  auto product = load_product(product_id);
  if (!product) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist");
  }
  if (auto denied = check_capability(admin_cap_id, capability_kind_t::admin,
                                     product_id, context.tx.signer)) {
    return make_error(*denied, "signer does not hold the admin capability");
  }
  auto complaint = load_complaint(complaint_id);
  if (!complaint) {
    return make_error(transaction_error_code::complaint_missing,
                      "complaint does not exist");
  }
  if (complaint->product_id != product_id) {
    return make_error(transaction_error_code::complaint_mismatch,
                      "complaint belongs to another product");
  }
  if (!product->dispute) {
    return make_error(transaction_error_code::dispute_false,
                      "no dispute is pending on this product");
  }
  if (product->complaint_id != complaint_id) {
    return make_error(transaction_error_code::complaint_mismatch,
                      "complaint is not the one pending on this product");
  }
  auto released = escrow::withdraw_all(product->payment);
  if (!released) {
    return make_error(transaction_error_code::escrow_empty,
                      "escrow was already released");
  }

  const auto recipient = for_consumer ? complaint->consumer : product->supplier;
  const auto amount = released->amount();
  auto account = load_account(recipient);
  escrow::deposit(account.balance, std::move(*released));

  product->dispute = false;
  product->settlement = for_consumer ? settlement_t::resolved_for_consumer
                                     : settlement_t::resolved_for_supplier;
  complaint->decision = for_consumer;
  complaint->resolved = true;
  complaint->resolved_at = context.now;

  context.batch.put(encoder_, key::make_product_key(encoder_, product_id),
                    *product);
  context.batch.put(encoder_, key::make_complaint_key(encoder_, complaint_id),
                    *complaint);
  context.batch.put(encoder_, key::make_account_key(encoder_, recipient),
                    account);

  const auto outcome = to_string(product->settlement);
  auto result = transaction_result_t{};
  result.events.push_back(
      make_event("dispute_resolved", {{"product_id", hex(product_id)},
                                      {"complaint_id", hex(complaint_id)},
                                      {"recipient", to_string(recipient)},
                                      {"amount", amount.str()},
                                      {"settlement", std::string{outcome}}}));
  spdlog::info("Dispute {} on product {} {}; released {} to {}",
               hex(complaint_id), hex(product_id), outcome, amount.str(),
               to_string(recipient));
  return result;
}

transaction_result_t engine::transfer_funds(transaction_context& context,
                                            const transfer_funds_t& payload) {
  const auto& sender = context.tx.signer;
  if (payload.amount == 0) {
    return make_error(transaction_error_code::invalid_transfer,
                      "amount must be positive");
  }
  if (payload.recipient == sender) {
    return make_error(transaction_error_code::invalid_transfer,
                      "sender and recipient are the same principal");
  }
  auto from = load_account(sender);
  auto value = escrow::withdraw(from.balance, payload.amount);
  if (!value) {
    return make_error(transaction_error_code::insufficient_balance,
                      fmt::format("balance {} cannot cover {}",
                                  from.balance.str(), payload.amount.str()));
  }
  auto to = load_account(payload.recipient);
  escrow::deposit(to.balance, std::move(*value));

  context.batch.put(encoder_, key::make_account_key(encoder_, sender), from);
  context.batch.put(encoder_,
                    key::make_account_key(encoder_, payload.recipient), to);

  auto result = transaction_result_t{};
  result.events.push_back(
      make_event("funds_transferred", {{"from", to_string(sender)},
                                       {"to", to_string(payload.recipient)},
                                       {"amount", payload.amount.str()}}));
  return result;
}

transaction_result_t engine::transfer_capability(
    transaction_context& context,
    const transfer_capability_t& payload) {
  auto capability = load_capability(payload.cap_id);
  if (!capability) {
    return make_error(transaction_error_code::capability_missing,
                      "capability does not exist");
  }
  if (capability->owner != context.tx.signer) {
    return make_error(transaction_error_code::invalid_capability,
                      "signer does not hold this capability");
  }

  capability->owner = payload.recipient;
  context.batch.put(encoder_,
                    key::make_capability_key(encoder_, payload.cap_id),
                    *capability);

  auto result = transaction_result_t{};
  result.events.push_back(make_event(
      "capability_transferred",
      {{"cap_id", hex(payload.cap_id)},
       {"kind", std::string{to_string(capability->kind)}},
       {"from", to_string(context.tx.signer)},
       {"to", to_string(payload.recipient)}}));
  spdlog::info("Capability {} handed to {}", hex(payload.cap_id),
               to_string(payload.recipient));
  return result;
}

}  // namespace bazaar::execution
