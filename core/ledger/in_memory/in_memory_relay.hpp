/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <memory>
#include <unordered_map>

#include "ledger/in_memory/in_memory_tokens.hpp"
#include "ledger/relay.hpp"

namespace xm::ledger::in_memory {

  /// Relay fee model: base fee plus a fee per payload and options byte
  struct RelayFeeModel {
    TokenAmount base_fee;
    TokenAmount per_byte_fee;
  };

  /**
   * Relay endpoint of one simulated ledger. Outbound bridged tokens are locked
   * at the endpoint address, inbound ones are minted to the receiver before
   * its callback runs.
   */
  class InMemoryRelayEndpoint : public RelayEndpoint {
   public:
    InMemoryRelayEndpoint(std::shared_ptr<InMemoryLedger> ledger,
                          std::shared_ptr<InMemoryTokens> tokens,
                          Address address,
                          Address bridged_token,
                          RelayFeeModel fee_model);

    Address address() const override;

    ChainId chainId() const;

    outcome::result<MessagingFee> quote(ChainId dst_chain_id,
                                        BytesIn payload,
                                        BytesIn options) const override;

    outcome::result<MessagingReceipt> send(
        const Address &sender,
        const RelaySendParams &params,
        const TokenAmount &native_fee) override;

    void registerReceiver(const Address &address,
                          std::shared_ptr<RelayReceiver> receiver);

    /**
     * Delivers message to its receiver on this ledger as a single call. A
     * rejected message is kept for retry.
     * @param message - message taken from the source ledger
     * @return receiver callback result
     */
    outcome::result<void> deliver(const RelayMessage &message);

    /// Redelivers a previously rejected message
    outcome::result<void> retry(const Hash256 &guid);

    const std::unordered_map<Hash256, RelayMessage> &failedMessages() const;

    /// Moves messages of committed calls out of the ledger
    std::vector<RelayMessage> takeOutbox();

   private:
    std::shared_ptr<InMemoryLedger> ledger_;
    std::shared_ptr<InMemoryTokens> tokens_;
    Address address_;
    Address bridged_token_;
    RelayFeeModel fee_model_;
    std::unordered_map<Address, std::shared_ptr<RelayReceiver>> receivers_;
    std::unordered_map<Hash256, RelayMessage> failed_;
    common::Logger logger_;
  };

  /**
   * Relay network connecting simulated ledgers. Delivery is explicit, so tests
   * decide when and in which order messages arrive, and may deliver one twice.
   */
  class RelayNetwork {
   public:
    RelayNetwork();

    void connect(std::shared_ptr<InMemoryRelayEndpoint> endpoint);

    /**
     * Collects sent messages from every endpoint
     * @return number of messages collected
     */
    size_t flush();

    const std::deque<RelayMessage> &pending() const;

    /// Delivers the oldest pending message
    outcome::result<void> deliverNext();

    /// Delivers pending message at index out of order
    outcome::result<void> deliverAt(size_t index);

    /// Delivers message regardless of whether it was already delivered
    outcome::result<void> deliver(const RelayMessage &message);

    /**
     * Delivers every pending message in order
     * @return number of rejected messages
     */
    size_t deliverAll();

   private:
    std::map<ChainId, std::shared_ptr<InMemoryRelayEndpoint>> endpoints_;
    std::deque<RelayMessage> pending_;
    common::Logger logger_;
  };

}  // namespace xm::ledger::in_memory
