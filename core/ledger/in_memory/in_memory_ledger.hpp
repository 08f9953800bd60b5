/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>
#include <type_traits>
#include <vector>

#include "common/logger.hpp"
#include "ledger/relay.hpp"
#include "ledger/runtime.hpp"

namespace xm::ledger::in_memory {

  /**
   * Whole mutable state of one simulated ledger. Copyable, a copy is the
   * snapshot a failed call is reverted to.
   */
  struct LedgerState {
    std::map<Address, TokenAmount> native;
    /** token -> holder -> balance */
    std::map<Address, std::map<Address, TokenAmount>> balances;
    /** token -> (owner, spender) -> allowance */
    std::map<Address, std::map<std::pair<Address, Address>, TokenAmount>>
        allowances;
    /** collection -> token id -> holder */
    std::map<Address, std::map<TokenId, Address>> nft_owners;
    /** collection -> (owner, operator) */
    std::map<Address, std::set<std::pair<Address, Address>>> operators;
    /** (destination, sender) -> last nonce */
    std::map<std::pair<ChainId, Address>, Nonce> outbound_nonces;
    /** Messages sent during committed calls, not yet taken by the network */
    std::vector<RelayMessage> outbox;
    std::vector<LogEntry> log;
  };

  class InMemoryLedger;

  class InMemoryRuntime : public Runtime {
   public:
    InMemoryRuntime(InMemoryLedger &ledger,
                    Address caller,
                    Address receiver,
                    TokenAmount value);

    ChainId getChainId() const override;

    Address getImmediateCaller() const override;

    Address getCurrentReceiver() const override;

    TokenAmount getValueReceived() const override;

    Timestamp getCurrentTime() const override;

    outcome::result<TokenAmount> getBalance(
        const Address &address) const override;

    outcome::result<void> sendFunds(const Address &to,
                                    const TokenAmount &amount) override;

    void emitEvent(Event event) override;

   private:
    InMemoryLedger &ledger_;
    Address caller_;
    Address receiver_;
    TokenAmount value_;
  };

  /**
   * Deterministic single ledger executing one call at a time
   */
  class InMemoryLedger {
   public:
    explicit InMemoryLedger(ChainId chain_id);

    ChainId chainId() const;

    Timestamp now() const;

    void setTime(Timestamp time);

    LedgerState &state();

    const LedgerState &state() const;

    TokenAmount balance(const Address &address) const;

    /// Credits native value out of thin air, genesis allocation
    void mintNative(const Address &to, const TokenAmount &amount);

    outcome::result<void> transferNative(const Address &from,
                                         const Address &to,
                                         const TokenAmount &amount);

    const std::vector<LogEntry> &events() const;

    /**
     * Runs one state-changing call. Attached value is moved from caller to
     * receiver before f runs. If either fails, ledger state and events are
     * restored to what they were before the call.
     * @param caller - immediate caller seen by the receiver
     * @param value - native value attached to the call
     * @param receiver - called contract
     * @param f - call body, gets the call runtime
     * @return result of f
     */
    template <typename F>
    std::invoke_result_t<F, Runtime &> execute(const Address &caller,
                                               const TokenAmount &value,
                                               const Address &receiver,
                                               F &&f) {
      using Result = std::invoke_result_t<F, Runtime &>;
      auto snapshot{state_};
      InMemoryRuntime runtime{*this, caller, receiver, value};
      auto res{[&]() -> Result {
        OUTCOME_TRY(transferNative(caller, receiver, value));
        return f(runtime);
      }()};
      if (res.has_error()) {
        logger_->debug("chain {}: call to {} reverted: {}",
                       chain_id_,
                       toString(receiver),
                       res.error().message());
        state_ = std::move(snapshot);
      }
      return res;
    }

   private:
    ChainId chain_id_;
    Timestamp time_{};
    LedgerState state_;
    common::Logger logger_;
  };

}  // namespace xm::ledger::in_memory
