#include <bazaar/common/critical.hpp>
#include <bazaar/escrow/coin.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace bazaar::escrow {

coin::coin(bazaar::schema::amount_t value) : value_{std::move(value)} {}

coin::coin(coin&& other) noexcept : value_{other.value_} {
  other.value_ = 0;
}

coin& coin::operator=(coin&& other) noexcept {
  if (this != &other) {
    if (!empty()) {
      bazaar::common::critical("coin overwritten while holding value");
    }
    value_ = other.value_;
    other.value_ = 0;
  }
  return *this;
}

coin::~coin() {
  if (!empty()) {
    spdlog::error("Dropping coin worth {}", value_.str());
    bazaar::common::critical("coin destroyed while holding value");
  }
}

std::optional<coin> withdraw(bazaar::schema::amount_t& balance,
                             const bazaar::schema::amount_t& value) {
  if (value > balance) {
    return std::nullopt;
  }
  balance -= value;
  return coin{value};
}

std::optional<coin> withdraw_all(bazaar::schema::amount_t& balance) {
  if (balance == 0) {
    return std::nullopt;
  }
  auto taken = coin{balance};
  balance = 0;
  return taken;
}

void deposit(bazaar::schema::amount_t& balance, coin&& value) {
  balance += value.value_;
  value.value_ = 0;
}

}  // namespace bazaar::escrow
