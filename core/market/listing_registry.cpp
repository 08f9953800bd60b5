/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/listing_registry.hpp"

namespace xm::market {
  using ledger::Delisted;
  using ledger::Listed;
  using ledger::ListedStatus;
  using ledger::PriceEdited;

  ListingRegistry::ListingRegistry(std::shared_ptr<MarketConfig> config,
                                   std::shared_ptr<NonFungibleTokens> nft)
      : config_{std::move(config)},
        nft_{std::move(nft)},
        logger_{common::createLogger("ListingRegistry")} {}

  outcome::result<void> ListingRegistry::requireHolder(
      const Runtime &runtime,
      const Address &asset_contract,
      const TokenId &asset_id) const {
    auto holder{nft_->ownerOf(asset_contract, asset_id)};
    if (!holder || holder.value() != runtime.getImmediateCaller()) {
      return MarketError::kNotTokenOwner;
    }
    return outcome::success();
  }

  outcome::result<ListingKey> ListingRegistry::list(
      Runtime &runtime,
      const Address &asset_contract,
      const TokenId &asset_id,
      const TokenAmount &price,
      bool crosschain) {
    if (!config_->isApprovedContract(asset_contract)) {
      return MarketError::kNotApprovedNFT;
    }
    OUTCOME_TRY(requireHolder(runtime, asset_contract, asset_id));
    if (price <= 0) {
      return MarketError::kInvalidPrice;
    }
    OUTCOME_TRY(key, makeListingKey(asset_contract, asset_id));

    auto status{crosschain ? ListingStatus::kActiveCrosschain
                           : ListingStatus::kActiveLocal};
    auto seller{runtime.getImmediateCaller()};
    listings_[key] = Listing{seller, asset_contract, asset_id, price, status};
    runtime.emitEvent(Listed{key,
                             seller,
                             asset_contract,
                             asset_id,
                             price,
                             crosschain ? ListedStatus::kCrosschain
                                        : ListedStatus::kLocal});
    logger_->debug("listed {} #{} at {} as {}",
                   toString(asset_contract),
                   asset_id.str(),
                   price.str(),
                   toString(status));
    return std::move(key);
  }

  outcome::result<void> ListingRegistry::editPrice(
      Runtime &runtime,
      const Address &asset_contract,
      const TokenId &asset_id,
      const TokenAmount &new_price) {
    OUTCOME_TRY(requireHolder(runtime, asset_contract, asset_id));
    if (new_price <= 0) {
      return MarketError::kInvalidPrice;
    }
    OUTCOME_TRY(key, makeListingKey(asset_contract, asset_id));
    auto it{listings_.find(key)};
    if (it == listings_.end() || !it->second.isActive()) {
      return MarketError::kListingNotActive;
    }
    it->second.price = new_price;
    runtime.emitEvent(PriceEdited{key, new_price});
    logger_->debug("price of {} #{} is {}",
                   toString(asset_contract),
                   asset_id.str(),
                   new_price.str());
    return outcome::success();
  }

  outcome::result<void> ListingRegistry::delist(Runtime &runtime,
                                                const Address &asset_contract,
                                                const TokenId &asset_id) {
    OUTCOME_TRY(requireHolder(runtime, asset_contract, asset_id));
    OUTCOME_TRY(key, makeListingKey(asset_contract, asset_id));
    auto it{listings_.find(key)};
    if (it != listings_.end()) {
      it->second.status = ListingStatus::kInactive;
    }
    runtime.emitEvent(Delisted{key});
    logger_->debug(
        "delisted {} #{}", toString(asset_contract), asset_id.str());
    return outcome::success();
  }

  Listing ListingRegistry::getListing(const ListingKey &key) const {
    auto it{listings_.find(key)};
    if (it == listings_.end()) {
      return {};
    }
    return it->second;
  }

  outcome::result<Listing> ListingRegistry::getListing(
      const Address &asset_contract, const TokenId &asset_id) const {
    OUTCOME_TRY(key, makeListingKey(asset_contract, asset_id));
    return getListing(key);
  }

  void ListingRegistry::close(const ListingKey &key) {
    auto it{listings_.find(key)};
    if (it != listings_.end()) {
      it->second.status = ListingStatus::kInactive;
    }
  }

}  // namespace xm::market
