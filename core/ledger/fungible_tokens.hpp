/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xm::ledger {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Fungible token contracts deployed on a ledger, addressed by token address
   */
  class FungibleTokens {
   public:
    virtual ~FungibleTokens() = default;

    virtual TokenAmount balanceOf(const Address &token,
                                  const Address &holder) const = 0;

    virtual TokenAmount allowance(const Address &token,
                                  const Address &owner,
                                  const Address &spender) const = 0;

    virtual outcome::result<void> transfer(const Address &token,
                                           const Address &from,
                                           const Address &to,
                                           const TokenAmount &amount) = 0;

    virtual outcome::result<void> approve(const Address &token,
                                          const Address &owner,
                                          const Address &spender,
                                          const TokenAmount &amount) = 0;

    /// Moves amount on behalf of from, consuming spender's allowance
    virtual outcome::result<void> transferFrom(const Address &token,
                                               const Address &spender,
                                               const Address &from,
                                               const Address &to,
                                               const TokenAmount &amount) = 0;
  };

  /**
   * Wrapped-native token: an ERC20-like token backed 1:1 by native value
   */
  class WrappedNative {
   public:
    virtual ~WrappedNative() = default;

    /// Token address of the wrapped-native contract
    virtual Address token() const = 0;

    /// Converts owner's native value to the same amount of wrapped token
    virtual outcome::result<void> deposit(const Address &owner,
                                          const TokenAmount &amount) = 0;

    /// Converts owner's wrapped token back to native value
    virtual outcome::result<void> withdraw(const Address &owner,
                                           const TokenAmount &amount) = 0;
  };
}  // namespace xm::ledger
