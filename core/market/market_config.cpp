/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/market_config.hpp"

#include "common/hexutil.hpp"

namespace xm::market {

  MarketConfig::MarketConfig(Deployment deployment)
      : deployment_{std::move(deployment)},
        logger_{common::createLogger("MarketConfig")} {}

  outcome::result<void> MarketConfig::requireOwner(
      const Address &caller) const {
    if (caller != deployment_.owner) {
      logger_->debug("{} is not the owner", toString(caller));
      return MarketError::kNotOwner;
    }
    return outcome::success();
  }

  const Address &MarketConfig::owner() const {
    return deployment_.owner;
  }

  outcome::result<void> MarketConfig::transferOwnership(
      const Address &caller, const Address &new_owner) {
    OUTCOME_TRY(requireOwner(caller));
    logger_->info("ownership {} -> {}", toString(caller), toString(new_owner));
    deployment_.owner = new_owner;
    return outcome::success();
  }

  outcome::result<void> MarketConfig::addApprovedContract(
      const Address &caller, const Address &asset_contract) {
    OUTCOME_TRY(requireOwner(caller));
    approved_contracts_.insert(asset_contract);
    logger_->debug("approved {}", toString(asset_contract));
    return outcome::success();
  }

  outcome::result<void> MarketConfig::removeApprovedContract(
      const Address &caller, const Address &asset_contract) {
    OUTCOME_TRY(requireOwner(caller));
    approved_contracts_.erase(asset_contract);
    logger_->debug("removed approval of {}", toString(asset_contract));
    return outcome::success();
  }

  bool MarketConfig::isApprovedContract(const Address &asset_contract) const {
    return approved_contracts_.count(asset_contract) != 0;
  }

  outcome::result<void> MarketConfig::setTrustedPeer(const Address &caller,
                                                     ChainId chain_id,
                                                     const Bytes &peer) {
    OUTCOME_TRY(requireOwner(caller));
    peers_[chain_id] = peer;
    logger_->debug(
        "peer of chain {} is 0x{}", chain_id, common::hex_lower(peer));
    return outcome::success();
  }

  outcome::result<void> MarketConfig::removeTrustedPeer(const Address &caller,
                                                        ChainId chain_id) {
    OUTCOME_TRY(requireOwner(caller));
    peers_.erase(chain_id);
    return outcome::success();
  }

  boost::optional<Bytes> MarketConfig::trustedPeer(ChainId chain_id) const {
    auto it{peers_.find(chain_id)};
    if (it == peers_.end()) {
      return boost::none;
    }
    return it->second;
  }

  outcome::result<void> MarketConfig::setFeeBps(const Address &caller,
                                                BasisPoints fee_bps) {
    OUTCOME_TRY(requireOwner(caller));
    if (!isValidFeeRate(fee_bps)) {
      return MarketError::kInvalidFeeRate;
    }
    fee_bps_ = fee_bps;
    return outcome::success();
  }

  BasisPoints MarketConfig::feeBps() const {
    return fee_bps_;
  }

  outcome::result<void> MarketConfig::setConversionPolicy(
      const Address &caller, const ConversionPolicy &policy) {
    OUTCOME_TRY(requireOwner(caller));
    if (!isValid(policy)) {
      return MarketError::kInvalidConversionPolicy;
    }
    conversion_policy_ = policy;
    return outcome::success();
  }

  const ConversionPolicy &MarketConfig::conversionPolicy() const {
    return conversion_policy_;
  }

  const Address &MarketConfig::relayEndpoint() const {
    return deployment_.relay_endpoint;
  }

  const Address &MarketConfig::wrappedNative() const {
    return deployment_.wrapped_native;
  }

  const Address &MarketConfig::stableToken() const {
    return deployment_.stable_token;
  }

  PoolFee MarketConfig::poolFee() const {
    return deployment_.pool_fee;
  }

  Timestamp MarketConfig::swapDeadlineWindow() const {
    return deployment_.swap_deadline_window;
  }

}  // namespace xm::market
