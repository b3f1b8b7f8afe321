#pragma once

#include <bazaar/schema/primitives.hpp>
#include <optional>

namespace bazaar::escrow {

class coin;

/// Take `value` out of `balance`. Empty when the balance is short.
[[nodiscard]] std::optional<coin> withdraw(bazaar::schema::amount_t& balance,
                                           const bazaar::schema::amount_t& value);

/// Take the whole of `balance`, leaving it at zero. Empty when the balance is
/// already zero, so a filled balance yields a coin exactly once.
[[nodiscard]] std::optional<coin> withdraw_all(
    bazaar::schema::amount_t& balance);

/// Merge `value` into `balance`. Locking a payment into escrow and crediting
/// an account are both a deposit.
void deposit(bazaar::schema::amount_t& balance, coin&& value);

/// Fungible value in flight between two balances.
///
/// Move-only. Value is created only by withdrawing from a balance and leaves
/// only by depositing into one; destroying a coin that still holds value is
/// a fund-loss invariant violation and terminates the process.
class coin final {
 public:
  coin() = default;
  coin(const coin&) = delete;
  coin& operator=(const coin&) = delete;
  coin(coin&& other) noexcept;
  coin& operator=(coin&& other) noexcept;
  ~coin();

  const bazaar::schema::amount_t& amount() const { return value_; }
  bool empty() const { return value_ == 0; }

 private:
  explicit coin(bazaar::schema::amount_t value);

  bazaar::schema::amount_t value_{};

  friend std::optional<coin> withdraw(bazaar::schema::amount_t&,
                                      const bazaar::schema::amount_t&);
  friend std::optional<coin> withdraw_all(bazaar::schema::amount_t&);
  friend void deposit(bazaar::schema::amount_t&, coin&&);
};

}  // namespace bazaar::escrow
