/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/outbound_initiator.hpp"

namespace xm::market {
  using ledger::CrosschainPurchaseSent;
  using ledger::ExactInputSingleParams;
  using ledger::RelaySendParams;

  OutboundInitiator::OutboundInitiator(
      std::shared_ptr<MarketConfig> config,
      std::shared_ptr<FungibleTokens> tokens,
      std::shared_ptr<WrappedNative> wrapped_native,
      std::shared_ptr<SwapRouter> swap_router,
      std::shared_ptr<RelayEndpoint> relay)
      : config_{std::move(config)},
        tokens_{std::move(tokens)},
        wrapped_native_{std::move(wrapped_native)},
        swap_router_{std::move(swap_router)},
        relay_{std::move(relay)},
        logger_{common::createLogger("OutboundInitiator")} {}

  outcome::result<MessagingFee> OutboundInitiator::quoteRelayFee(
      ChainId dst_chain_id,
      const PurchasePayload &payload,
      BytesIn options) const {
    OUTCOME_TRY(encoded, codec::payload::encode(payload));
    return relay_->quote(dst_chain_id, encoded, options);
  }

  outcome::result<MessagingReceipt> OutboundInitiator::buy(
      Runtime &runtime,
      ChainId dst_chain_id,
      const PurchasePayload &payload,
      const TokenAmount &price,
      const TokenAmount &min_stable_out,
      const Bytes &options) {
    if (min_stable_out <= 0) {
      return MarketError::kZeroSlippageFloor;
    }
    if (price <= 0) {
      return MarketError::kInvalidPrice;
    }
    auto peer{config_->trustedPeer(dst_chain_id)};
    if (!peer) {
      return MarketError::kUnknownDestination;
    }
    OUTCOME_TRY(encoded, codec::payload::encode(payload));
    OUTCOME_TRY(fee, relay_->quote(dst_chain_id, encoded, options));
    const auto value{runtime.getValueReceived()};
    if (value < price + fee.native_fee) {
      logger_->debug("value {} does not cover price {} and relay fee {}",
                     value.str(),
                     price.str(),
                     fee.native_fee.str());
      return MarketError::kInsufficientFunds;
    }

    const auto self{runtime.getCurrentReceiver()};
    const auto &wrapped{config_->wrappedNative()};
    const auto &stable{config_->stableToken()};
    OUTCOME_TRY(wrapped_native_->deposit(self, price));
    OUTCOME_TRY(
        tokens_->approve(wrapped, self, swap_router_->address(), price));
    OUTCOME_TRY(stable_amount,
                changeError(swap_router_->exactInputSingle(
                                self,
                                ExactInputSingleParams{
                                    wrapped,
                                    stable,
                                    config_->poolFee(),
                                    self,
                                    runtime.getCurrentTime()
                                        + config_->swapDeadlineWindow(),
                                    price,
                                    min_stable_out}),
                            MarketError::kSwapFailed));

    OUTCOME_TRY(
        tokens_->approve(stable, self, relay_->address(), stable_amount));
    OUTCOME_TRY(receipt,
                relay_->send(self,
                             RelaySendParams{dst_chain_id,
                                             *peer,
                                             encoded,
                                             runtime.getImmediateCaller(),
                                             options,
                                             stable,
                                             stable_amount},
                             value - price));

    runtime.emitEvent(CrosschainPurchaseSent{dst_chain_id,
                                             receipt.guid,
                                             receipt.nonce,
                                             payload.asset_contract,
                                             payload.asset_id,
                                             payload.recipient,
                                             stable_amount,
                                             receipt.fee.native_fee});
    logger_->info("purchase of {} #{} sent to chain {}, nonce {}, {} stable",
                  toString(payload.asset_contract),
                  payload.asset_id.str(),
                  dst_chain_id,
                  receipt.nonce,
                  stable_amount.str());
    return std::move(receipt);
  }

}  // namespace xm::market
