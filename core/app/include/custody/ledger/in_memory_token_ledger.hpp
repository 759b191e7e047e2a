#pragma once

#include "custody/ledger/i_token_ledger.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace custody {

// -----------------------------------------------------------------------------
// InMemoryTokenLedger
// -----------------------------------------------------------------------------
//
// @brief  Process-local ITokenLedger with balances and pull-transfer
//         allowances.
//
// @details
// A pull-transfer is executed on behalf of an operator (the custody
// service's own identity). transfer(from, to, amount) succeeds only if:
//
//   1. from and to are non-empty
//   2. balanceOf(from) >= amount
//   3. allowance(from, operator) >= amount
//   4. crediting `to` does not overflow
//
// On success the balance moves and the allowance shrinks by `amount`. A payer
// with enough balance but no (or a revoked) allowance is exactly the case the
// core reports as TransferFailed.
//
// Thread model: one mutex covers balances and allowances so transfer() is
// atomic with respect to every other call.
// -----------------------------------------------------------------------------
class InMemoryTokenLedger final : public ITokenLedger {
 public:
  explicit InMemoryTokenLedger(domain::Principal operator_id);

  InMemoryTokenLedger(const InMemoryTokenLedger&) = delete;
  InMemoryTokenLedger& operator=(const InMemoryTokenLedger&) = delete;

  domain::Amount balanceOf(const domain::Principal& principal) const override;

  bool transfer(const domain::Principal& from, const domain::Principal& to,
                domain::Amount amount) override;

  // Creates `amount` new tokens in `to`. Returns false on overflow or an
  // empty principal.
  bool mint(const domain::Principal& to, domain::Amount amount);

  // Sets (not adds to) the amount `spender` may pull from `owner`.
  void approve(const domain::Principal& owner, const domain::Principal& spender,
               domain::Amount amount);

  domain::Amount allowance(const domain::Principal& owner,
                           const domain::Principal& spender) const;

  domain::Amount totalSupply() const;

  // Principals holding a balance entry. Only mint() and a credit create one.
  std::size_t accountCount() const;

  const domain::Principal& operatorId() const { return operator_id_; }

 private:
  using AllowanceKey = std::pair<domain::Principal, domain::Principal>;

  const domain::Principal operator_id_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::Principal, domain::Amount> balances_;
  std::map<AllowanceKey, domain::Amount> allowances_;  // {owner, spender}
  domain::Amount total_supply_{0};
};

}  // namespace custody
