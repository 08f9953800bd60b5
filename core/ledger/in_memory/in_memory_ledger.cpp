/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/in_memory_ledger.hpp"

#include "ledger/in_memory/ledger_error.hpp"

namespace xm::ledger::in_memory {

  InMemoryRuntime::InMemoryRuntime(InMemoryLedger &ledger,
                                   Address caller,
                                   Address receiver,
                                   TokenAmount value)
      : ledger_{ledger},
        caller_{caller},
        receiver_{receiver},
        value_{std::move(value)} {}

  ChainId InMemoryRuntime::getChainId() const {
    return ledger_.chainId();
  }

  Address InMemoryRuntime::getImmediateCaller() const {
    return caller_;
  }

  Address InMemoryRuntime::getCurrentReceiver() const {
    return receiver_;
  }

  TokenAmount InMemoryRuntime::getValueReceived() const {
    return value_;
  }

  Timestamp InMemoryRuntime::getCurrentTime() const {
    return ledger_.now();
  }

  outcome::result<TokenAmount> InMemoryRuntime::getBalance(
      const Address &address) const {
    return ledger_.balance(address);
  }

  outcome::result<void> InMemoryRuntime::sendFunds(const Address &to,
                                                   const TokenAmount &amount) {
    return ledger_.transferNative(receiver_, to, amount);
  }

  void InMemoryRuntime::emitEvent(Event event) {
    ledger_.state().log.push_back({receiver_, std::move(event)});
  }

  InMemoryLedger::InMemoryLedger(ChainId chain_id)
      : chain_id_{chain_id},
        logger_{common::createLogger("InMemoryLedger")} {}

  ChainId InMemoryLedger::chainId() const {
    return chain_id_;
  }

  Timestamp InMemoryLedger::now() const {
    return time_;
  }

  void InMemoryLedger::setTime(Timestamp time) {
    time_ = time;
  }

  LedgerState &InMemoryLedger::state() {
    return state_;
  }

  const LedgerState &InMemoryLedger::state() const {
    return state_;
  }

  TokenAmount InMemoryLedger::balance(const Address &address) const {
    auto it{state_.native.find(address)};
    if (it == state_.native.end()) {
      return 0;
    }
    return it->second;
  }

  void InMemoryLedger::mintNative(const Address &to,
                                  const TokenAmount &amount) {
    state_.native[to] += amount;
  }

  outcome::result<void> InMemoryLedger::transferNative(
      const Address &from, const Address &to, const TokenAmount &amount) {
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    if (amount == 0) {
      return outcome::success();
    }
    auto &from_balance{state_.native[from]};
    if (from_balance < amount) {
      return LedgerError::kInsufficientBalance;
    }
    from_balance -= amount;
    state_.native[to] += amount;
    return outcome::success();
  }

  const std::vector<LogEntry> &InMemoryLedger::events() const {
    return state_.log;
  }

}  // namespace xm::ledger::in_memory
