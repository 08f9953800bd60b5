/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_map>

#include "ledger/non_fungible_tokens.hpp"
#include "ledger/runtime.hpp"
#include "market/listing.hpp"
#include "market/market_config.hpp"

namespace xm::market {
  using ledger::NonFungibleTokens;
  using ledger::Runtime;

  /**
   * Listings of one marketplace instance, one per asset. Custody stays with
   * the seller while listed.
   */
  class ListingRegistry {
   public:
    ListingRegistry(std::shared_ptr<MarketConfig> config,
                    std::shared_ptr<NonFungibleTokens> nft);

    /**
     * Creates or overwrites the listing of an asset held by the caller
     * @param runtime - call context, caller is the seller
     * @param asset_contract - approved asset contract
     * @param asset_id - asset id
     * @param price - positive price in native units
     * @param crosschain - list for cross-chain purchase instead of local
     * @return listing key
     */
    outcome::result<ListingKey> list(Runtime &runtime,
                                     const Address &asset_contract,
                                     const TokenId &asset_id,
                                     const TokenAmount &price,
                                     bool crosschain);

    outcome::result<void> editPrice(Runtime &runtime,
                                    const Address &asset_contract,
                                    const TokenId &asset_id,
                                    const TokenAmount &new_price);

    outcome::result<void> delist(Runtime &runtime,
                                 const Address &asset_contract,
                                 const TokenId &asset_id);

    /// Listing by key, zeroed INACTIVE listing if absent
    Listing getListing(const ListingKey &key) const;

    outcome::result<Listing> getListing(const Address &asset_contract,
                                        const TokenId &asset_id) const;

    /// Marks a purchased listing INACTIVE
    void close(const ListingKey &key);

   private:
    outcome::result<void> requireHolder(const Runtime &runtime,
                                        const Address &asset_contract,
                                        const TokenId &asset_id) const;

    std::shared_ptr<MarketConfig> config_;
    std::shared_ptr<NonFungibleTokens> nft_;
    std::unordered_map<ListingKey, Listing> listings_;
    common::Logger logger_;
  };

}  // namespace xm::market
