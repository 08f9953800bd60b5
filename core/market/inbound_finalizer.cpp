/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/inbound_finalizer.hpp"

namespace xm::market {
  using ledger::CrosschainPurchaseFinalized;
  using ledger::ExactInputSingleParams;
  using ledger::FinalizationFailed;

  InboundFinalizer::InboundFinalizer(
      std::shared_ptr<MarketConfig> config,
      std::shared_ptr<ListingRegistry> registry,
      std::shared_ptr<NonFungibleTokens> nft,
      std::shared_ptr<FungibleTokens> tokens,
      std::shared_ptr<SwapRouter> swap_router,
      std::shared_ptr<AccruedFees> fees)
      : config_{std::move(config)},
        registry_{std::move(registry)},
        nft_{std::move(nft)},
        tokens_{std::move(tokens)},
        swap_router_{std::move(swap_router)},
        fees_{std::move(fees)},
        logger_{common::createLogger("InboundFinalizer")} {}

  outcome::result<void> InboundFinalizer::onRelayReceive(
      Runtime &runtime, const RelayMessage &message) {
    if (runtime.getImmediateCaller() != config_->relayEndpoint()) {
      return MarketError::kNotRelayEndpoint;
    }
    auto peer{config_->trustedPeer(message.src_chain_id)};
    if (!peer || *peer != message.sender) {
      logger_->warn("message {} from untrusted sender 0x{} on chain {}",
                    message.nonce,
                    common::hex_lower(message.sender),
                    message.src_chain_id);
      return MarketError::kUntrustedSender;
    }
    if (message.token != config_->stableToken()) {
      return MarketError::kUnexpectedBridgeToken;
    }
    OUTCOME_TRY(purchase,
                changeError(codec::payload::decodePurchase(message.payload),
                            MarketError::kMalformedPayload));
    OUTCOME_TRY(key,
                changeError(makeListingKey(purchase.asset_contract,
                                           purchase.asset_id),
                            MarketError::kMalformedPayload));

    const ReceiptKey receipt_key{message.src_chain_id, message.nonce};
    auto listing{registry_->getListing(key)};
    if (listing.status != ListingStatus::kActiveCrosschain
        || receipts_.count(receipt_key) != 0
        || settled_.count(receipt_key) != 0) {
      logger_->warn("stale purchase of {} #{} from chain {}, nonce {}",
                    toString(purchase.asset_contract),
                    purchase.asset_id.str(),
                    message.src_chain_id,
                    message.nonce);
      return MarketError::kStaleListing;
    }

    Holding holding{message.token, message.amount};
    auto finalized{settle(runtime, key, listing, purchase, holding)};
    if (!finalized) {
      auto reason{finalized.error().message()};
      logger_->error(
          "purchase of {} #{} from chain {}, nonce {} unsettled: {}",
          toString(purchase.asset_contract),
          purchase.asset_id.str(),
          message.src_chain_id,
          message.nonce,
          reason);
      runtime.emitEvent(FinalizationFailed{message.src_chain_id,
                                           message.nonce,
                                           key,
                                           holding.token,
                                           holding.amount,
                                           reason});
      receipts_[receipt_key] = UnsettledReceipt{message.src_chain_id,
                                                message.nonce,
                                                key,
                                                purchase,
                                                holding.token,
                                                holding.amount,
                                                reason};
      return outcome::success();
    }
    finalized.value().src_chain_id = message.src_chain_id;
    finalized.value().nonce = message.nonce;
    runtime.emitEvent(finalized.value());
    settled_.insert(receipt_key);
    return outcome::success();
  }

  outcome::result<void> InboundFinalizer::retry(Runtime &runtime,
                                                ChainId src_chain_id,
                                                Nonce nonce) {
    auto it{receipts_.find({src_chain_id, nonce})};
    if (it == receipts_.end()) {
      return MarketError::kUnknownReceipt;
    }
    const auto &receipt{it->second};
    auto listing{registry_->getListing(receipt.key)};
    if (listing.status != ListingStatus::kActiveCrosschain) {
      return MarketError::kStaleListing;
    }
    Holding holding{receipt.token, receipt.amount};
    OUTCOME_TRY(
        finalized,
        settle(runtime, receipt.key, listing, receipt.purchase, holding));
    finalized.src_chain_id = src_chain_id;
    finalized.nonce = nonce;
    runtime.emitEvent(finalized);
    settled_.insert(it->first);
    receipts_.erase(it);
    return outcome::success();
  }

  outcome::result<CrosschainPurchaseFinalized> InboundFinalizer::settle(
      Runtime &runtime,
      const ListingKey &key,
      const Listing &listing,
      const PurchasePayload &purchase,
      Holding &holding) {
    const auto self{runtime.getCurrentReceiver()};
    OUTCOME_TRY(holder,
                nft_->ownerOf(listing.asset_contract, listing.asset_id));
    if (holder != listing.seller
        || !nft_->isApprovedForAll(listing.asset_contract, holder, self)) {
      return MarketError::kNotTokenOwner;
    }

    const auto &wrapped{config_->wrappedNative()};
    if (holding.token != wrapped) {
      auto minimum{minimumInbound(listing.price, config_->conversionPolicy())};
      OUTCOME_TRY(tokens_->approve(
          holding.token, self, swap_router_->address(), holding.amount));
      OUTCOME_TRY(realized,
                  changeError(swap_router_->exactInputSingle(
                                  self,
                                  ExactInputSingleParams{
                                      holding.token,
                                      wrapped,
                                      config_->poolFee(),
                                      self,
                                      runtime.getCurrentTime()
                                          + config_->swapDeadlineWindow(),
                                      holding.amount,
                                      minimum}),
                              MarketError::kSwapFailed));
      holding = Holding{wrapped, realized};
    }

    // payout must not fail once the asset has moved
    const TokenAmount available{tokens_->balanceOf(wrapped, self)
                                - fees_->wrapped};
    if (available < holding.amount) {
      return MarketError::kInsufficientFunds;
    }
    OUTCOME_TRY(nft_->transferFrom(listing.asset_contract,
                                   self,
                                   listing.seller,
                                   purchase.recipient,
                                   listing.asset_id));
    const TokenAmount fee{feeAmount(holding.amount, config_->feeBps())};
    OUTCOME_TRY(
        tokens_->transfer(wrapped, self, listing.seller, holding.amount - fee));

    fees_->wrapped += fee;
    registry_->close(key);
    logger_->info("sold {} #{} cross-chain to {}, realized {}, fee {}",
                  toString(listing.asset_contract),
                  listing.asset_id.str(),
                  toString(purchase.recipient),
                  holding.amount.str(),
                  fee.str());
    return CrosschainPurchaseFinalized{key,
                                       {},
                                       {},
                                       purchase.recipient,
                                       listing.seller,
                                       holding.amount,
                                       fee};
  }

  boost::optional<UnsettledReceipt> InboundFinalizer::unsettledReceipt(
      ChainId src_chain_id, Nonce nonce) const {
    auto it{receipts_.find({src_chain_id, nonce})};
    if (it == receipts_.end()) {
      return boost::none;
    }
    return it->second;
  }

  const std::map<ReceiptKey, UnsettledReceipt>
      &InboundFinalizer::unsettledReceipts() const {
    return receipts_;
  }

}  // namespace xm::market
