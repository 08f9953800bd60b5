/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/in_memory_relay.hpp"

#include "common/endian.hpp"
#include "crypto/sha/sha256.hpp"
#include "ledger/in_memory/ledger_error.hpp"

namespace xm::ledger::in_memory {

  namespace {
    using common::putUint32BigEndian;
    using common::putUint64BigEndian;

    /// Message id commits to the path and nonce
    Hash256 makeGuid(ChainId src,
                     const Address &sender,
                     ChainId dst,
                     BytesIn receiver,
                     Nonce nonce) {
      Bytes preimage;
      putUint32BigEndian(preimage, src);
      append(preimage, sender);
      putUint32BigEndian(preimage, dst);
      append(preimage, receiver);
      putUint64BigEndian(preimage, nonce);
      return crypto::sha::sha256(preimage);
    }
  }  // namespace

  InMemoryRelayEndpoint::InMemoryRelayEndpoint(
      std::shared_ptr<InMemoryLedger> ledger,
      std::shared_ptr<InMemoryTokens> tokens,
      Address address,
      Address bridged_token,
      RelayFeeModel fee_model)
      : ledger_{std::move(ledger)},
        tokens_{std::move(tokens)},
        address_{address},
        bridged_token_{bridged_token},
        fee_model_{std::move(fee_model)},
        logger_{common::createLogger("RelayEndpoint")} {}

  Address InMemoryRelayEndpoint::address() const {
    return address_;
  }

  ChainId InMemoryRelayEndpoint::chainId() const {
    return ledger_->chainId();
  }

  outcome::result<MessagingFee> InMemoryRelayEndpoint::quote(
      ChainId, BytesIn payload, BytesIn options) const {
    TokenAmount bytes{payload.size() + options.size()};
    return MessagingFee{fee_model_.base_fee + fee_model_.per_byte_fee * bytes};
  }

  outcome::result<MessagingReceipt> InMemoryRelayEndpoint::send(
      const Address &sender,
      const RelaySendParams &params,
      const TokenAmount &native_fee) {
    OUTCOME_TRY(fee,
                quote(params.dst_chain_id, params.payload, params.options));
    if (native_fee < fee.native_fee) {
      return LedgerError::kInsufficientRelayFee;
    }
    if (params.amount != 0 && params.token != bridged_token_) {
      return LedgerError::kUnsupportedBridgeToken;
    }
    OUTCOME_TRY(ledger_->transferNative(sender, address_, native_fee));
    OUTCOME_TRY(ledger_->transferNative(
        address_, params.refund_address, native_fee - fee.native_fee));
    if (params.amount != 0) {
      OUTCOME_TRY(tokens_->transferFrom(
          params.token, address_, sender, address_, params.amount));
    }

    auto &state{ledger_->state()};
    auto nonce{++state.outbound_nonces[std::make_pair(params.dst_chain_id,
                                                      sender)]};
    auto guid{makeGuid(
        chainId(), sender, params.dst_chain_id, params.receiver, nonce)};
    state.outbox.push_back(RelayMessage{chainId(),
                                        params.dst_chain_id,
                                        sender.toPeerBytes(),
                                        params.receiver,
                                        nonce,
                                        guid,
                                        params.token,
                                        params.amount,
                                        params.payload});
    logger_->debug("chain {}: message {} nonce {} to chain {}",
                   chainId(),
                   guid.toHex(),
                   nonce,
                   params.dst_chain_id);
    return MessagingReceipt{guid, nonce, fee};
  }

  void InMemoryRelayEndpoint::registerReceiver(
      const Address &address, std::shared_ptr<RelayReceiver> receiver) {
    receivers_[address] = std::move(receiver);
  }

  outcome::result<void> InMemoryRelayEndpoint::deliver(
      const RelayMessage &message) {
    if (message.dst_chain_id != chainId()) {
      return LedgerError::kUnknownChain;
    }
    OUTCOME_TRY(receiver_address, Address::fromPeerBytes(message.receiver));
    auto it{receivers_.find(receiver_address)};
    if (it == receivers_.end()) {
      return LedgerError::kUnknownReceiver;
    }
    auto receiver{it->second};

    auto local{message};
    local.token = bridged_token_;
    auto res{ledger_->execute(
        address_,
        0,
        receiver_address,
        [&](Runtime &runtime) -> outcome::result<void> {
          OUTCOME_TRY(
              tokens_->mint(bridged_token_, receiver_address, local.amount));
          return receiver->onRelayReceive(runtime, local);
        })};
    if (!res) {
      logger_->warn("chain {}: message {} from chain {} rejected: {}",
                    chainId(),
                    message.guid.toHex(),
                    message.src_chain_id,
                    res.error().message());
      failed_[message.guid] = message;
      return res.error();
    }
    failed_.erase(message.guid);
    return outcome::success();
  }

  outcome::result<void> InMemoryRelayEndpoint::retry(const Hash256 &guid) {
    auto it{failed_.find(guid)};
    if (it == failed_.end()) {
      return LedgerError::kUnknownMessage;
    }
    auto message{it->second};
    return deliver(message);
  }

  const std::unordered_map<Hash256, RelayMessage>
      &InMemoryRelayEndpoint::failedMessages() const {
    return failed_;
  }

  std::vector<RelayMessage> InMemoryRelayEndpoint::takeOutbox() {
    std::vector<RelayMessage> messages;
    std::swap(messages, ledger_->state().outbox);
    return messages;
  }

  RelayNetwork::RelayNetwork()
      : logger_{common::createLogger("RelayNetwork")} {}

  void RelayNetwork::connect(std::shared_ptr<InMemoryRelayEndpoint> endpoint) {
    auto chain_id{endpoint->chainId()};
    endpoints_[chain_id] = std::move(endpoint);
  }

  size_t RelayNetwork::flush() {
    size_t collected{0};
    for (auto &it : endpoints_) {
      for (auto &message : it.second->takeOutbox()) {
        pending_.push_back(std::move(message));
        ++collected;
      }
    }
    return collected;
  }

  const std::deque<RelayMessage> &RelayNetwork::pending() const {
    return pending_;
  }

  outcome::result<void> RelayNetwork::deliverNext() {
    return deliverAt(0);
  }

  outcome::result<void> RelayNetwork::deliverAt(size_t index) {
    if (index >= pending_.size()) {
      return LedgerError::kNoPendingMessage;
    }
    auto message{pending_[index]};
    pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(index));
    return deliver(message);
  }

  outcome::result<void> RelayNetwork::deliver(const RelayMessage &message) {
    auto it{endpoints_.find(message.dst_chain_id)};
    if (it == endpoints_.end()) {
      return LedgerError::kUnknownChain;
    }
    return it->second->deliver(message);
  }

  size_t RelayNetwork::deliverAll() {
    size_t rejected{0};
    while (!pending_.empty()) {
      if (!deliverNext()) {
        ++rejected;
      }
    }
    if (rejected != 0) {
      logger_->warn("{} messages rejected", rejected);
    }
    return rejected;
  }

}  // namespace xm::ledger::in_memory
