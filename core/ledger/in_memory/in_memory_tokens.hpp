/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "ledger/fungible_tokens.hpp"
#include "ledger/in_memory/in_memory_ledger.hpp"

namespace xm::ledger::in_memory {

  /**
   * Every fungible token of one simulated ledger
   */
  class InMemoryTokens : public FungibleTokens {
   public:
    explicit InMemoryTokens(std::shared_ptr<InMemoryLedger> ledger);

    TokenAmount balanceOf(const Address &token,
                          const Address &holder) const override;

    TokenAmount allowance(const Address &token,
                          const Address &owner,
                          const Address &spender) const override;

    outcome::result<void> transfer(const Address &token,
                                   const Address &from,
                                   const Address &to,
                                   const TokenAmount &amount) override;

    outcome::result<void> approve(const Address &token,
                                  const Address &owner,
                                  const Address &spender,
                                  const TokenAmount &amount) override;

    outcome::result<void> transferFrom(const Address &token,
                                       const Address &spender,
                                       const Address &from,
                                       const Address &to,
                                       const TokenAmount &amount) override;

    outcome::result<void> mint(const Address &token,
                               const Address &to,
                               const TokenAmount &amount);

    outcome::result<void> burn(const Address &token,
                               const Address &from,
                               const TokenAmount &amount);

   private:
    std::shared_ptr<InMemoryLedger> ledger_;
  };

  /**
   * Wrapped native token. Deposited native value is held by the token address.
   */
  class InMemoryWrappedNative : public WrappedNative {
   public:
    InMemoryWrappedNative(std::shared_ptr<InMemoryLedger> ledger,
                          std::shared_ptr<InMemoryTokens> tokens,
                          Address token);

    Address token() const override;

    outcome::result<void> deposit(const Address &owner,
                                  const TokenAmount &amount) override;

    outcome::result<void> withdraw(const Address &owner,
                                   const TokenAmount &amount) override;

   private:
    std::shared_ptr<InMemoryLedger> ledger_;
    std::shared_ptr<InMemoryTokens> tokens_;
    Address token_;
  };

}  // namespace xm::ledger::in_memory
