#include <bazaar/market/lifecycle.hpp>
#include <bazaar/schema/query_error_code.hpp>
#include <bazaar/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <tuple>
#include <vector>

using bazaar::schema::amount_t;
using bazaar::schema::transaction_error_code;
using bazaar::testing::code_of;
using bazaar::testing::kConsumer;
using bazaar::testing::kOtherConsumer;
using bazaar::testing::kStranger;
using bazaar::testing::kSupplier;

namespace {

constexpr auto kListedAt = uint64_t{10'000};
constexpr auto kDuration = uint64_t{1'000};
constexpr auto kDeadline = kListedAt + kDuration;

}  // namespace

TEST(product_lifecycle, listing_creates_product_and_capability) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_listing"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 85, kListedAt);

  auto product = bazaar::testing::query_product(fixture.engine(), product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->supplier, kSupplier);
  EXPECT_EQ(product->price, amount_t{100});
  EXPECT_EQ(product->quality, 85u);
  EXPECT_EQ(product->created_at, kListedAt);
  EXPECT_EQ(product->deadline, kDeadline);
  EXPECT_FALSE(product->status);
  EXPECT_EQ(product->payment, 0);
  EXPECT_EQ(bazaar::market::lifecycle_phase(*product),
            bazaar::schema::product_phase_t::listed);

  auto capability =
      bazaar::testing::query_capability(fixture.engine(), cap_id);
  ASSERT_TRUE(capability.has_value());
  EXPECT_EQ(capability->kind, bazaar::schema::capability_kind_t::product);
  EXPECT_EQ(capability->product_id, product_id);
  EXPECT_EQ(capability->owner, kSupplier);
}

TEST(product_lifecycle, listing_rejects_zero_price_and_duration) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_listing_params"};
  auto zero_price = fixture.execute(
      kSupplier,
      bazaar::schema::create_product_t{
          .description = "free", .quality = 10, .price = 0, .duration = 5},
      kListedAt);
  EXPECT_EQ(zero_price.code,
            code_of(transaction_error_code::invalid_product_parameters));

  auto zero_duration = fixture.execute(
      kSupplier,
      bazaar::schema::create_product_t{
          .description = "instant", .quality = 10, .price = 5, .duration = 0},
      kListedAt);
  EXPECT_EQ(zero_duration.code,
            code_of(transaction_error_code::invalid_product_parameters));
}

TEST(product_lifecycle, quality_above_range_is_rejected_by_default) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_quality_strict"};
  auto result = fixture.execute(
      kSupplier,
      bazaar::schema::create_product_t{
          .description = "legendary", .quality = 101, .price = 5,
          .duration = 5},
      kListedAt);
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::invalid_product_parameters));
}

TEST(product_lifecycle, quality_above_range_is_accepted_when_unenforced) {
  auto fixture = bazaar::testing::execution_fixture{
      "bazaar_quality_open", bazaar::testing::make_test_genesis(), false,
      false};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 5, kDuration, 250, kListedAt);
  auto product = bazaar::testing::query_product(fixture.engine(), product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->quality, 250u);
}

TEST(product_lifecycle, scenario_confirmation_releases_escrow_to_consumer) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_scenario_a"};
  auto& engine = fixture.engine();
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);

  auto bid = fixture.bid(kConsumer, product_id, {}, kListedAt + 100);
  ASSERT_EQ(bid.code, 0u) << bid.info;

  auto chosen = fixture.choose(kSupplier, product_id, cap_id, 150, kConsumer,
                               kListedAt + 200);
  ASSERT_EQ(chosen.code, 0u) << chosen.info;
  EXPECT_EQ(bazaar::testing::query_balance(engine, kSupplier),
            amount_t{bazaar::testing::kSupplierFunds - 150});

  auto locked = bazaar::testing::query_product(engine, product_id);
  ASSERT_TRUE(locked.has_value());
  EXPECT_TRUE(locked->status);
  EXPECT_EQ(locked->consumer, kConsumer);
  EXPECT_EQ(locked->payment, amount_t{150});

  auto submitted = fixture.execute(
      kConsumer, bazaar::schema::submit_order_t{.product_id = product_id},
      kListedAt + 500);
  ASSERT_EQ(submitted.code, 0u) << submitted.info;

  auto confirmed = fixture.execute(
      kSupplier,
      bazaar::schema::confirm_order_t{.product_id = product_id,
                                      .cap_id = cap_id},
      kListedAt + 600);
  ASSERT_EQ(confirmed.code, 0u) << confirmed.info;
  ASSERT_EQ(confirmed.events.size(), 1u);
  EXPECT_EQ(confirmed.events[0].type, "escrow_released");

  EXPECT_EQ(bazaar::testing::query_balance(engine, kConsumer), amount_t{150});
  auto settled = bazaar::testing::query_product(engine, product_id);
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->payment, 0);
  EXPECT_EQ(settled->settlement, bazaar::schema::settlement_t::confirmed);
  EXPECT_EQ(bazaar::market::lifecycle_phase(*settled),
            bazaar::schema::product_phase_t::confirmed);
}

TEST(product_lifecycle, escrow_is_released_at_most_once) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_single_release"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);
  ASSERT_EQ(fixture
                .choose(kSupplier, product_id, cap_id, 100, kConsumer,
                        kListedAt)
                .code,
            0u);
  ASSERT_EQ(fixture
                .execute(kConsumer,
                         bazaar::schema::submit_order_t{.product_id =
                                                            product_id},
                         kListedAt + 1)
                .code,
            0u);
  const auto confirm = bazaar::schema::confirm_order_t{
      .product_id = product_id, .cap_id = cap_id};
  ASSERT_EQ(fixture.execute(kSupplier, confirm, kListedAt + 2).code, 0u);

  auto again = fixture.execute(kSupplier, confirm, kListedAt + 3);
  EXPECT_EQ(again.code, code_of(transaction_error_code::escrow_empty));
  EXPECT_EQ(bazaar::testing::query_balance(fixture.engine(), kConsumer),
            amount_t{100});

  // A settled product cannot be pulled into a dispute afterwards.
  auto complaint = fixture.execute(
      kConsumer,
      bazaar::schema::file_complaint_t{.product_id = product_id,
                                       .reason = "late"},
      kDeadline + 1);
  EXPECT_EQ(complaint.code, code_of(transaction_error_code::product_settled));
}

TEST(product_lifecycle, selection_is_exclusive) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_exclusive"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);
  ASSERT_EQ(fixture.bid(kOtherConsumer, product_id, {}, kListedAt).code, 0u);
  ASSERT_EQ(fixture
                .choose(kSupplier, product_id, cap_id, 100, kConsumer,
                        kListedAt)
                .code,
            0u);

  auto second = fixture.choose(kSupplier, product_id, cap_id, 100,
                               kOtherConsumer, kListedAt + 1);
  EXPECT_EQ(second.code, code_of(transaction_error_code::out_of_stock));

  auto late_bid =
      fixture.bid(kStranger, product_id, {}, kListedAt);
  EXPECT_EQ(late_bid.code, code_of(transaction_error_code::out_of_stock));

  auto product = bazaar::testing::query_product(fixture.engine(), product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->consumer, kConsumer);
  EXPECT_EQ(product->payment, amount_t{100});
  EXPECT_EQ(bazaar::testing::query_balance(fixture.engine(), kSupplier),
            amount_t{bazaar::testing::kSupplierFunds - 100});
}

TEST(product_lifecycle, chosen_bid_is_returned_and_removed) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_bid_round_trip"};
  auto& engine = fixture.engine();
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 90, kListedAt);
  ASSERT_EQ(fixture
                .bid(kConsumer, product_id, {"high_quality", "gift_wrap"},
                     kListedAt + 5)
                .code,
            0u);
  ASSERT_EQ(fixture.bid(kOtherConsumer, product_id, {}, kListedAt + 6).code,
            0u);
  EXPECT_EQ(bazaar::testing::query_bids(engine, product_id).size(), 2u);

  auto chosen = fixture.choose(kSupplier, product_id, cap_id, 120, kConsumer,
                               kListedAt + 7);
  ASSERT_EQ(chosen.code, 0u) << chosen.info;
  auto returned = fixture.decode_result<bazaar::schema::consumer_state_t>(chosen);
  EXPECT_EQ(returned.bidder, kConsumer);
  EXPECT_EQ(returned.product_id, product_id);
  EXPECT_EQ(returned.description, "for the studio");
  EXPECT_EQ(returned.requirements,
            (std::vector<std::string>{"high_quality", "gift_wrap"}));
  EXPECT_EQ(returned.submitted_at, kListedAt + 5);

  auto remaining = bazaar::testing::query_bids(engine, product_id);
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].bidder, kOtherConsumer);
  auto lookup = bazaar::testing::query_by(
      engine, "/product/bid", std::tuple{product_id, kConsumer});
  EXPECT_EQ(lookup.code,
            static_cast<uint32_t>(bazaar::schema::query_error_code::not_found));
  auto product = bazaar::testing::query_product(engine, product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->bid_count, 1u);
}

TEST(product_lifecycle, high_quality_bids_need_quality_eighty) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_requirements"};
  auto [low_id, low_cap] =
      fixture.list_product(kSupplier, 10, kDuration, 79, kListedAt);
  auto [high_id, high_cap] =
      fixture.list_product(kSupplier, 10, kDuration, 80, kListedAt);

  auto rejected = fixture.bid(kConsumer, low_id, {"high_quality"}, kListedAt);
  EXPECT_EQ(rejected.code,
            code_of(transaction_error_code::requirements_not_met));
  EXPECT_TRUE(bazaar::testing::query_bids(fixture.engine(), low_id).empty());

  auto accepted = fixture.bid(kConsumer, high_id, {"high_quality"}, kListedAt);
  EXPECT_EQ(accepted.code, 0u) << accepted.info;

  auto plain = fixture.bid(kConsumer, low_id, {"express"}, kListedAt);
  EXPECT_EQ(plain.code, 0u) << plain.info;
}

TEST(product_lifecycle, bids_reject_duplicates) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_duplicates"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 10, kDuration, 90, kListedAt);

  auto repeated_tags = fixture.bid(
      kConsumer, product_id, {"express", "express"}, kListedAt);
  EXPECT_EQ(repeated_tags.code,
            code_of(transaction_error_code::duplicate_requirement));
  EXPECT_TRUE(
      bazaar::testing::query_bids(fixture.engine(), product_id).empty());

  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);
  auto second = fixture.bid(kConsumer, product_id, {"express"}, kListedAt);
  EXPECT_EQ(second.code, code_of(transaction_error_code::duplicate_bid));

  auto missing = fixture.bid(kConsumer, bazaar::testing::make_hash(99), {},
                             kListedAt);
  EXPECT_EQ(missing.code, code_of(transaction_error_code::product_missing));
}

TEST(product_lifecycle, selection_checks_capability_payment_and_bid) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_selection_checks"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  auto [other_id, other_cap] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);

  auto unknown_cap = fixture.choose(kSupplier, product_id,
                                    bazaar::testing::make_hash(77), 100,
                                    kConsumer, kListedAt);
  EXPECT_EQ(unknown_cap.code,
            code_of(transaction_error_code::capability_missing));

  auto foreign_cap = fixture.choose(kSupplier, product_id, other_cap, 100,
                                    kConsumer, kListedAt);
  EXPECT_EQ(foreign_cap.code,
            code_of(transaction_error_code::invalid_capability));

  auto not_holder = fixture.choose(kStranger, product_id, cap_id, 100,
                                   kConsumer, kListedAt);
  EXPECT_EQ(not_holder.code,
            code_of(transaction_error_code::invalid_capability));

  auto underpaid = fixture.choose(kSupplier, product_id, cap_id, 99,
                                  kConsumer, kListedAt);
  EXPECT_EQ(underpaid.code,
            code_of(transaction_error_code::insufficient_funds));

  auto no_bid = fixture.choose(kSupplier, product_id, cap_id, 100,
                               kOtherConsumer, kListedAt);
  EXPECT_EQ(no_bid.code, code_of(transaction_error_code::no_such_bid));

  auto overdrawn =
      fixture.choose(kSupplier, product_id, cap_id,
                     bazaar::testing::kSupplierFunds + 1, kConsumer, kListedAt);
  EXPECT_EQ(overdrawn.code,
            code_of(transaction_error_code::insufficient_balance));

  auto product = bazaar::testing::query_product(fixture.engine(), product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_FALSE(product->status);
  EXPECT_EQ(product->payment, 0);
  EXPECT_EQ(product->bid_count, 1u);
  EXPECT_EQ(bazaar::testing::query_balance(fixture.engine(), kSupplier),
            amount_t{bazaar::testing::kSupplierFunds});
}

TEST(product_lifecycle, order_submission_only_before_deadline_by_consumer) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_submit_window"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);
  ASSERT_EQ(fixture
                .choose(kSupplier, product_id, cap_id, 100, kConsumer,
                        kListedAt)
                .code,
            0u);
  const auto submit = bazaar::schema::submit_order_t{.product_id = product_id};

  auto by_supplier = fixture.execute(kSupplier, submit, kListedAt + 1);
  EXPECT_EQ(by_supplier.code, code_of(transaction_error_code::wrong_address));

  auto at_deadline = fixture.execute(kConsumer, submit, kDeadline);
  EXPECT_EQ(at_deadline.code,
            code_of(transaction_error_code::deadline_expired));

  auto in_time = fixture.execute(kConsumer, submit, kDeadline - 1);
  EXPECT_EQ(in_time.code, 0u) << in_time.info;
  auto repeated = fixture.execute(kConsumer, submit, kDeadline - 1);
  EXPECT_EQ(repeated.code, 0u) << repeated.info;
}

TEST(product_lifecycle, confirmation_requires_submission_before_deadline) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_confirm_window"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);
  ASSERT_EQ(fixture
                .choose(kSupplier, product_id, cap_id, 100, kConsumer,
                        kListedAt)
                .code,
            0u);
  const auto confirm = bazaar::schema::confirm_order_t{
      .product_id = product_id, .cap_id = cap_id};

  auto early = fixture.execute(kSupplier, confirm, kListedAt + 1);
  EXPECT_EQ(early.code, code_of(transaction_error_code::order_not_submitted));

  ASSERT_EQ(fixture
                .execute(kConsumer,
                         bazaar::schema::submit_order_t{.product_id =
                                                            product_id},
                         kListedAt + 2)
                .code,
            0u);
  auto late = fixture.execute(kSupplier, confirm, kDeadline);
  EXPECT_EQ(late.code, code_of(transaction_error_code::deadline_expired));

  auto product = bazaar::testing::query_product(fixture.engine(), product_id);
  ASSERT_TRUE(product.has_value());
  EXPECT_EQ(product->payment, amount_t{100});
}

TEST(product_lifecycle, transferred_capability_moves_control) {
  auto fixture = bazaar::testing::execution_fixture{"bazaar_cap_transfer"};
  auto [product_id, cap_id] =
      fixture.list_product(kSupplier, 100, kDuration, 50, kListedAt);
  ASSERT_EQ(fixture.bid(kConsumer, product_id, {}, kListedAt).code, 0u);

  auto stolen = fixture.execute(
      kStranger,
      bazaar::schema::transfer_capability_t{.cap_id = cap_id,
                                            .recipient = kStranger},
      kListedAt);
  EXPECT_EQ(stolen.code, code_of(transaction_error_code::invalid_capability));

  auto handed = fixture.execute(
      kSupplier,
      bazaar::schema::transfer_capability_t{.cap_id = cap_id,
                                            .recipient = kStranger},
      kListedAt);
  ASSERT_EQ(handed.code, 0u) << handed.info;

  auto by_old_owner = fixture.choose(kSupplier, product_id, cap_id, 100,
                                     kConsumer, kListedAt);
  EXPECT_EQ(by_old_owner.code,
            code_of(transaction_error_code::invalid_capability));

  // The new holder pays the escrow from its own account.
  auto unfunded = fixture.choose(kStranger, product_id, cap_id, 100,
                                 kConsumer, kListedAt);
  EXPECT_EQ(unfunded.code,
            code_of(transaction_error_code::insufficient_balance));
}
