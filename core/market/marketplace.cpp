/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/marketplace.hpp"

namespace xm::market {
  using ledger::FeesWithdrawn;

  Marketplace::Marketplace(std::shared_ptr<MarketConfig> config,
                           std::shared_ptr<NonFungibleTokens> nft,
                           std::shared_ptr<FungibleTokens> tokens,
                           std::shared_ptr<WrappedNative> wrapped_native,
                           std::shared_ptr<SwapRouter> swap_router,
                           std::shared_ptr<RelayEndpoint> relay)
      : config_{config},
        tokens_{tokens},
        fees_{std::make_shared<AccruedFees>()},
        registry_{std::make_shared<ListingRegistry>(config, nft)},
        local_{config, registry_, nft, fees_},
        outbound_{config, tokens, std::move(wrapped_native), swap_router,
                  std::move(relay)},
        inbound_{config, registry_, nft, tokens, swap_router, fees_},
        logger_{common::createLogger("Marketplace")} {}

  outcome::result<ListingKey> Marketplace::list(Runtime &runtime,
                                                const Address &asset_contract,
                                                const TokenId &asset_id,
                                                const TokenAmount &price,
                                                bool crosschain) {
    return registry_->list(
        runtime, asset_contract, asset_id, price, crosschain);
  }

  outcome::result<void> Marketplace::editPrice(Runtime &runtime,
                                               const Address &asset_contract,
                                               const TokenId &asset_id,
                                               const TokenAmount &new_price) {
    return registry_->editPrice(runtime, asset_contract, asset_id, new_price);
  }

  outcome::result<void> Marketplace::delist(Runtime &runtime,
                                            const Address &asset_contract,
                                            const TokenId &asset_id) {
    return registry_->delist(runtime, asset_contract, asset_id);
  }

  Listing Marketplace::getListing(const ListingKey &key) const {
    return registry_->getListing(key);
  }

  outcome::result<Listing> Marketplace::getListing(
      const Address &asset_contract, const TokenId &asset_id) const {
    return registry_->getListing(asset_contract, asset_id);
  }

  outcome::result<ledger::LocalPurchase> Marketplace::buyLocal(
      Runtime &runtime,
      const Address &asset_contract,
      const TokenId &asset_id,
      const Address &recipient) {
    return local_.buy(runtime, asset_contract, asset_id, recipient);
  }

  outcome::result<MessagingFee> Marketplace::quoteRelayFee(
      ChainId dst_chain_id,
      const Address &asset_contract,
      const TokenId &asset_id,
      const Address &recipient,
      const Bytes &options) const {
    return outbound_.quoteRelayFee(
        dst_chain_id, {asset_contract, asset_id, recipient}, options);
  }

  outcome::result<MessagingReceipt> Marketplace::buyCrosschain(
      Runtime &runtime,
      ChainId dst_chain_id,
      const Address &asset_contract,
      const TokenId &asset_id,
      const Address &recipient,
      const TokenAmount &price,
      const TokenAmount &min_stable_out,
      const Bytes &options) {
    return outbound_.buy(runtime,
                         dst_chain_id,
                         {asset_contract, asset_id, recipient},
                         price,
                         min_stable_out,
                         options);
  }

  outcome::result<void> Marketplace::onRelayReceive(
      Runtime &runtime, const RelayMessage &message) {
    return inbound_.onRelayReceive(runtime, message);
  }

  outcome::result<void> Marketplace::retryFinalization(Runtime &runtime,
                                                       ChainId src_chain_id,
                                                       Nonce nonce) {
    if (runtime.getImmediateCaller() != config_->owner()) {
      return MarketError::kNotOwner;
    }
    return inbound_.retry(runtime, src_chain_id, nonce);
  }

  outcome::result<void> Marketplace::withdrawFees(Runtime &runtime,
                                                  const Address &to) {
    if (runtime.getImmediateCaller() != config_->owner()) {
      return MarketError::kNotOwner;
    }
    if (fees_->native == 0 && fees_->wrapped == 0) {
      return MarketError::kNothingToWithdraw;
    }
    const auto self{runtime.getCurrentReceiver()};
    OUTCOME_TRY(runtime.sendFunds(to, fees_->native));
    OUTCOME_TRY(
        tokens_->transfer(config_->wrappedNative(), self, to, fees_->wrapped));

    runtime.emitEvent(FeesWithdrawn{to, fees_->native, fees_->wrapped});
    logger_->info("withdrawn fees {} native, {} wrapped to {}",
                  fees_->native.str(),
                  fees_->wrapped.str(),
                  toString(to));
    *fees_ = AccruedFees{};
    return outcome::success();
  }

  outcome::result<void> Marketplace::transferOwnership(
      Runtime &runtime, const Address &new_owner) {
    return config_->transferOwnership(runtime.getImmediateCaller(), new_owner);
  }

  outcome::result<void> Marketplace::addApprovedContract(
      Runtime &runtime, const Address &asset_contract) {
    return config_->addApprovedContract(runtime.getImmediateCaller(),
                                        asset_contract);
  }

  outcome::result<void> Marketplace::removeApprovedContract(
      Runtime &runtime, const Address &asset_contract) {
    return config_->removeApprovedContract(runtime.getImmediateCaller(),
                                           asset_contract);
  }

  outcome::result<void> Marketplace::setTrustedPeer(Runtime &runtime,
                                                    ChainId chain_id,
                                                    const Bytes &peer) {
    return config_->setTrustedPeer(
        runtime.getImmediateCaller(), chain_id, peer);
  }

  outcome::result<void> Marketplace::removeTrustedPeer(Runtime &runtime,
                                                       ChainId chain_id) {
    return config_->removeTrustedPeer(runtime.getImmediateCaller(), chain_id);
  }

  outcome::result<void> Marketplace::setFeeBps(Runtime &runtime,
                                               BasisPoints fee_bps) {
    return config_->setFeeBps(runtime.getImmediateCaller(), fee_bps);
  }

  outcome::result<void> Marketplace::setConversionPolicy(
      Runtime &runtime, const ConversionPolicy &policy) {
    return config_->setConversionPolicy(runtime.getImmediateCaller(), policy);
  }

  const MarketConfig &Marketplace::config() const {
    return *config_;
  }

  const AccruedFees &Marketplace::accruedFees() const {
    return *fees_;
  }

  boost::optional<UnsettledReceipt> Marketplace::unsettledReceipt(
      ChainId src_chain_id, Nonce nonce) const {
    return inbound_.unsettledReceipt(src_chain_id, nonce);
  }

}  // namespace xm::market
