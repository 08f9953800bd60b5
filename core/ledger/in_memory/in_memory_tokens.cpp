/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/in_memory_tokens.hpp"

#include "ledger/in_memory/ledger_error.hpp"

namespace xm::ledger::in_memory {

  InMemoryTokens::InMemoryTokens(std::shared_ptr<InMemoryLedger> ledger)
      : ledger_{std::move(ledger)} {}

  TokenAmount InMemoryTokens::balanceOf(const Address &token,
                                        const Address &holder) const {
    const auto &balances{ledger_->state().balances};
    auto it{balances.find(token)};
    if (it == balances.end()) {
      return 0;
    }
    auto balance{it->second.find(holder)};
    return balance == it->second.end() ? TokenAmount{0} : balance->second;
  }

  TokenAmount InMemoryTokens::allowance(const Address &token,
                                        const Address &owner,
                                        const Address &spender) const {
    const auto &allowances{ledger_->state().allowances};
    auto it{allowances.find(token)};
    if (it == allowances.end()) {
      return 0;
    }
    auto allowance{it->second.find({owner, spender})};
    return allowance == it->second.end() ? TokenAmount{0}
                                         : allowance->second;
  }

  outcome::result<void> InMemoryTokens::transfer(const Address &token,
                                                 const Address &from,
                                                 const Address &to,
                                                 const TokenAmount &amount) {
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    if (balanceOf(token, from) < amount) {
      return LedgerError::kInsufficientBalance;
    }
    auto &balances{ledger_->state().balances[token]};
    balances[from] -= amount;
    balances[to] += amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryTokens::approve(const Address &token,
                                                const Address &owner,
                                                const Address &spender,
                                                const TokenAmount &amount) {
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    ledger_->state().allowances[token][{owner, spender}] = amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryTokens::transferFrom(
      const Address &token,
      const Address &spender,
      const Address &from,
      const Address &to,
      const TokenAmount &amount) {
    if (spender != from) {
      auto allowed{allowance(token, from, spender)};
      if (allowed < amount) {
        return LedgerError::kInsufficientAllowance;
      }
      OUTCOME_TRY(transfer(token, from, to, amount));
      ledger_->state().allowances[token][{from, spender}] = allowed - amount;
      return outcome::success();
    }
    return transfer(token, from, to, amount);
  }

  outcome::result<void> InMemoryTokens::mint(const Address &token,
                                             const Address &to,
                                             const TokenAmount &amount) {
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    ledger_->state().balances[token][to] += amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryTokens::burn(const Address &token,
                                             const Address &from,
                                             const TokenAmount &amount) {
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    if (balanceOf(token, from) < amount) {
      return LedgerError::kInsufficientBalance;
    }
    ledger_->state().balances[token][from] -= amount;
    return outcome::success();
  }

  InMemoryWrappedNative::InMemoryWrappedNative(
      std::shared_ptr<InMemoryLedger> ledger,
      std::shared_ptr<InMemoryTokens> tokens,
      Address token)
      : ledger_{std::move(ledger)}, tokens_{std::move(tokens)}, token_{token} {}

  Address InMemoryWrappedNative::token() const {
    return token_;
  }

  outcome::result<void> InMemoryWrappedNative::deposit(
      const Address &owner, const TokenAmount &amount) {
    OUTCOME_TRY(ledger_->transferNative(owner, token_, amount));
    return tokens_->mint(token_, owner, amount);
  }

  outcome::result<void> InMemoryWrappedNative::withdraw(
      const Address &owner, const TokenAmount &amount) {
    OUTCOME_TRY(tokens_->burn(token_, owner, amount));
    return ledger_->transferNative(token_, owner, amount);
  }

}  // namespace xm::ledger::in_memory
