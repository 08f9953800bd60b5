/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/local_settlement.hpp"

namespace xm::market {
  using ledger::LocalPurchase;

  LocalSettlement::LocalSettlement(std::shared_ptr<MarketConfig> config,
                                   std::shared_ptr<ListingRegistry> registry,
                                   std::shared_ptr<NonFungibleTokens> nft,
                                   std::shared_ptr<AccruedFees> fees)
      : config_{std::move(config)},
        registry_{std::move(registry)},
        nft_{std::move(nft)},
        fees_{std::move(fees)},
        logger_{common::createLogger("LocalSettlement")} {}

  outcome::result<LocalPurchase> LocalSettlement::buy(
      Runtime &runtime,
      const Address &asset_contract,
      const TokenId &asset_id,
      const Address &recipient) {
    OUTCOME_TRY(key, makeListingKey(asset_contract, asset_id));
    auto listing{registry_->getListing(key)};
    if (listing.status != ListingStatus::kActiveLocal) {
      return MarketError::kNotActiveLocalListing;
    }
    const auto value{runtime.getValueReceived()};
    if (value < listing.price) {
      return MarketError::kInsufficientFunds;
    }
    if (value > listing.price) {
      return MarketError::kExcessFunds;
    }

    const TokenAmount fee{feeAmount(listing.price, config_->feeBps())};
    OUTCOME_TRY(nft_->transferFrom(asset_contract,
                                   runtime.getCurrentReceiver(),
                                   listing.seller,
                                   recipient,
                                   asset_id));
    OUTCOME_TRY(runtime.sendFunds(listing.seller, listing.price - fee));

    fees_->native += fee;
    registry_->close(key);
    LocalPurchase purchase{key,
                           runtime.getImmediateCaller(),
                           recipient,
                           listing.seller,
                           listing.price,
                           fee};
    runtime.emitEvent(purchase);
    logger_->info("sold {} #{} to {} for {}, fee {}",
                  toString(asset_contract),
                  asset_id.str(),
                  toString(recipient),
                  listing.price.str(),
                  fee.str());
    return std::move(purchase);
  }

}  // namespace xm::market
