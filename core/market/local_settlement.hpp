/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "market/listing_registry.hpp"

namespace xm::market {

  /**
   * Same-ledger purchases paid in native value
   */
  class LocalSettlement {
   public:
    LocalSettlement(std::shared_ptr<MarketConfig> config,
                    std::shared_ptr<ListingRegistry> registry,
                    std::shared_ptr<NonFungibleTokens> nft,
                    std::shared_ptr<AccruedFees> fees);

    /**
     * Buys an ACTIVE_LOCAL listing. Attached value must equal the price, the
     * asset goes to recipient, the seller is paid the price net of fee.
     * @param runtime - call context, value attached by the buyer
     * @param asset_contract - asset contract
     * @param asset_id - asset id
     * @param recipient - new holder of the asset
     * @return purchase as logged
     */
    outcome::result<ledger::LocalPurchase> buy(Runtime &runtime,
                                               const Address &asset_contract,
                                               const TokenId &asset_id,
                                               const Address &recipient);

   private:
    std::shared_ptr<MarketConfig> config_;
    std::shared_ptr<ListingRegistry> registry_;
    std::shared_ptr<NonFungibleTokens> nft_;
    std::shared_ptr<AccruedFees> fees_;
    common::Logger logger_;
  };

}  // namespace xm::market
