/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "ledger/events.hpp"

namespace xm::ledger {
  using primitives::Timestamp;

  /**
   * @class Runtime is the ledger's call context exposed to a contract during
   * one state-changing call. A call that returns an error is reverted by the
   * ledger as a whole.
   */
  class Runtime {
   public:
    virtual ~Runtime() = default;

    /// Relay-level identifier of the ledger executing the call
    virtual ChainId getChainId() const = 0;

    /// Address that invoked the current call
    virtual Address getImmediateCaller() const = 0;

    /// Address of the contract being called
    virtual Address getCurrentReceiver() const = 0;

    /// Native value attached to the call, already credited to the receiver
    virtual TokenAmount getValueReceived() const = 0;

    virtual Timestamp getCurrentTime() const = 0;

    /**
     * Native balance of an account
     * @param address - account
     * @return balance
     */
    virtual outcome::result<TokenAmount> getBalance(
        const Address &address) const = 0;

    /**
     * Pays native value from the current receiver
     * @param to - payee
     * @param amount - value to send
     */
    virtual outcome::result<void> sendFunds(const Address &to,
                                            const TokenAmount &amount) = 0;

    /// Appends event to the call's log, dropped if the call fails
    virtual void emitEvent(Event event) = 0;
  };
}  // namespace xm::ledger
