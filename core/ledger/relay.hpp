/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "ledger/runtime.hpp"

namespace xm::ledger {
  using common::Hash256;
  using primitives::ChainId;
  using primitives::Nonce;

  struct MessagingFee {
    /** Cost of delivery in native units of the source ledger */
    TokenAmount native_fee;
  };

  struct MessagingReceipt {
    Hash256 guid;
    Nonce nonce{};
    MessagingFee fee;
  };

  struct RelaySendParams {
    ChainId dst_chain_id{};
    /** Receiver address bytes on the destination ledger */
    Bytes receiver;
    Bytes payload;
    /** Receives unused native fee */
    Address refund_address;
    Bytes options;
    /** Bridged token on the source ledger, pulled from sender by allowance */
    Address token;
    TokenAmount amount;
  };

  /**
   * Message as delivered on the destination ledger. The two ledgers share no
   * state, this is the only thing crossing the boundary.
   */
  struct RelayMessage {
    ChainId src_chain_id{};
    ChainId dst_chain_id{};
    Bytes sender;
    Bytes receiver;
    Nonce nonce{};
    Hash256 guid;
    /** Bridged token on the destination ledger */
    Address token;
    TokenAmount amount;
    Bytes payload;
  };

  /**
   * Message relay / bridge network endpoint on one ledger
   */
  class RelayEndpoint {
   public:
    virtual ~RelayEndpoint() = default;

    /// Endpoint address, the only caller allowed to deliver messages
    virtual Address address() const = 0;

    /**
     * Fee quote for sending payload to destination
     * @param dst_chain_id - destination ledger
     * @param payload - message payload
     * @param options - relay options
     * @return fee in native units
     */
    virtual outcome::result<MessagingFee> quote(ChainId dst_chain_id,
                                                BytesIn payload,
                                                BytesIn options) const = 0;

    /**
     * Dispatches message with bridged value
     * @param sender - sending contract
     * @param params - destination, payload and bridged token
     * @param native_fee - native value paid by sender for delivery
     * @return relay-assigned receipt
     */
    virtual outcome::result<MessagingReceipt> send(
        const Address &sender,
        const RelaySendParams &params,
        const TokenAmount &native_fee) = 0;
  };

  /**
   * Contract accepting relay deliveries
   */
  class RelayReceiver {
   public:
    virtual ~RelayReceiver() = default;

    /**
     * Invoked by the endpoint after the bridged amount was credited to the
     * receiver
     * @param runtime - call context, immediate caller is the endpoint
     * @param message - delivered message
     */
    virtual outcome::result<void> onRelayReceive(
        Runtime &runtime, const RelayMessage &message) = 0;
  };
}  // namespace xm::ledger
