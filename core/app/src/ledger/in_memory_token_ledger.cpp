#include "custody/ledger/in_memory_token_ledger.hpp"

#include <iostream>
#include <limits>

namespace custody {

namespace {

bool addOverflows(domain::Amount a, domain::Amount b) {
  return a > std::numeric_limits<domain::Amount>::max() - b;
}

}  // namespace

InMemoryTokenLedger::InMemoryTokenLedger(domain::Principal operator_id)
    : operator_id_(std::move(operator_id)) {}

domain::Amount InMemoryTokenLedger::balanceOf(
    const domain::Principal& principal) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(principal);
  return it != balances_.end() ? it->second : 0;
}

// -----------------------------------------------------------------------------
// transfer(): all-or-nothing pull on behalf of the operator
// -----------------------------------------------------------------------------
bool InMemoryTokenLedger::transfer(const domain::Principal& from,
                                   const domain::Principal& to,
                                   domain::Amount amount) {
  if (from.empty() || to.empty()) {
    return false;
  }

  std::lock_guard lock(mutex_);

  // Unknown principals hold nothing and have granted nothing. Lookups must
  // not insert: callers arrive from the wire with arbitrary names.
  auto from_it = balances_.find(from);
  const domain::Amount from_balance =
      from_it != balances_.end() ? from_it->second : 0;
  if (from_balance < amount) {
    return false;
  }

  auto allowance_it = allowances_.find(AllowanceKey{from, operator_id_});
  const domain::Amount granted =
      allowance_it != allowances_.end() ? allowance_it->second : 0;
  if (granted < amount) {
    std::cerr << "[TokenLedger] transfer refused: " << from
              << " has not authorized " << operator_id_ << " to pull "
              << amount << ".\n";
    return false;
  }

  if (amount == 0) {
    return true;
  }

  if (from != to) {
    auto to_it = balances_.find(to);
    if (to_it != balances_.end() && addOverflows(to_it->second, amount)) {
      return false;
    }
    from_it->second -= amount;
    balances_[to] += amount;
  }
  allowance_it->second -= amount;
  return true;
}

bool InMemoryTokenLedger::mint(const domain::Principal& to,
                               domain::Amount amount) {
  if (to.empty()) {
    return false;
  }
  std::lock_guard lock(mutex_);
  domain::Amount& balance = balances_[to];
  if (addOverflows(balance, amount) || addOverflows(total_supply_, amount)) {
    return false;
  }
  balance += amount;
  total_supply_ += amount;
  return true;
}

void InMemoryTokenLedger::approve(const domain::Principal& owner,
                                  const domain::Principal& spender,
                                  domain::Amount amount) {
  std::lock_guard lock(mutex_);
  allowances_[AllowanceKey{owner, spender}] = amount;
}

domain::Amount InMemoryTokenLedger::allowance(
    const domain::Principal& owner, const domain::Principal& spender) const {
  std::lock_guard lock(mutex_);
  auto it = allowances_.find(AllowanceKey{owner, spender});
  return it != allowances_.end() ? it->second : 0;
}

std::size_t InMemoryTokenLedger::accountCount() const {
  std::lock_guard lock(mutex_);
  return balances_.size();
}

domain::Amount InMemoryTokenLedger::totalSupply() const {
  std::lock_guard lock(mutex_);
  return total_supply_;
}

}  // namespace custody
