/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/listing_registry.hpp"

#include "crypto/sha/sha256.hpp"
#include "testutil/market/market_test_fixture.hpp"

namespace xm::market {
  using ledger::Delisted;
  using ledger::Listed;
  using ledger::ListedStatus;
  using ledger::PriceEdited;
  using testing::Return;
  using testutil::MarketTestFixture;

  struct ListingRegistryTest : MarketTestFixture {
    void SetUp() override {
      MarketTestFixture::SetUp();
      asOwner([&](MarketConfig &config, const Address &owner) {
        return config.addApprovedContract(owner, collection);
      });
      holderIs(seller);
      caller = seller;
      key = makeListingKey(collection, asset_id).value();
    }

    Listing listing() const {
      return registry.getListing(key);
    }

    ListingRegistry registry{config, nft};
    ListingKey key;
  };

  /**
   * @given asset contract and asset id
   * @when make listing key
   * @then sha256 of 20 address bytes followed by 32-byte big-endian id
   */
  TEST_F(ListingRegistryTest, ListingKey) {
    Bytes preimage{collection.begin(), collection.end()};
    preimage.resize(preimage.size() + 31, 0);
    preimage.push_back(42);
    EXPECT_EQ(key, crypto::sha::sha256(preimage));
    EXPECT_NE(key, makeListingKey(collection, 43).value());
    EXPECT_NE(key, makeListingKey(stranger, asset_id).value());
  }

  /**
   * @given asset never listed
   * @when get listing
   * @then zeroed INACTIVE listing
   */
  TEST_F(ListingRegistryTest, AbsentListing) {
    auto absent{listing()};
    EXPECT_EQ(absent.status, ListingStatus::kInactive);
    EXPECT_EQ(absent.price, 0);
    EXPECT_TRUE(absent.seller.isZero());
  }

  /**
   * @given seller holding an asset of an approved contract
   * @when list it for local purchase
   * @then listing is ACTIVE_LOCAL with seller and price, Listed emitted
   */
  TEST_F(ListingRegistryTest, ListLocal) {
    EXPECT_OUTCOME_EQ(registry.list(runtime, collection, asset_id, price, false),
                      key);
    auto listed{listing()};
    EXPECT_EQ(listed.status, ListingStatus::kActiveLocal);
    EXPECT_EQ(listed.seller, seller);
    EXPECT_EQ(listed.asset_contract, collection);
    EXPECT_EQ(listed.asset_id, asset_id);
    EXPECT_EQ(listed.price, price);

    auto emitted{eventsOf<Listed>()};
    ASSERT_EQ(emitted.size(), 1);
    EXPECT_EQ(emitted[0].key, key);
    EXPECT_EQ(emitted[0].status, ListedStatus::kLocal);
  }

  /**
   * @given seller
   * @when list with cross-chain enabled
   * @then listing is ACTIVE_CROSSCHAIN
   */
  TEST_F(ListingRegistryTest, ListCrosschain) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, true));
    EXPECT_EQ(listing().status, ListingStatus::kActiveCrosschain);
    EXPECT_EQ(eventsOf<Listed>().at(0).status, ListedStatus::kCrosschain);
  }

  /**
   * @given asset contract not approved
   * @when list
   * @then kNotApprovedNFT and no listing
   */
  TEST_F(ListingRegistryTest, ListNotApproved) {
    asOwner([&](MarketConfig &config, const Address &owner) {
      return config.removeApprovedContract(owner, collection);
    });
    EXPECT_OUTCOME_ERROR(
        MarketError::kNotApprovedNFT,
        registry.list(runtime, collection, asset_id, price, false));
    EXPECT_FALSE(listing().isActive());
    EXPECT_TRUE(events.empty());
  }

  /**
   * @given caller not holding the asset
   * @when list
   * @then kNotTokenOwner
   */
  TEST_F(ListingRegistryTest, ListNotHolder) {
    caller = stranger;
    EXPECT_OUTCOME_ERROR(
        MarketError::kNotTokenOwner,
        registry.list(runtime, collection, asset_id, price, false));
    EXPECT_FALSE(listing().isActive());
  }

  /**
   * @given asset that does not exist
   * @when list
   * @then kNotTokenOwner
   */
  TEST_F(ListingRegistryTest, ListMissingAsset) {
    EXPECT_CALL(*nft, ownerOf(collection, TokenId{7}))
        .WillOnce(Return(outcome::result<Address>{
            std::make_error_code(std::errc::invalid_argument)}));
    EXPECT_OUTCOME_ERROR(MarketError::kNotTokenOwner,
                         registry.list(runtime, collection, 7, price, false));
  }

  /**
   * @given seller
   * @when list at zero price
   * @then kInvalidPrice
   */
  TEST_F(ListingRegistryTest, ListZeroPrice) {
    EXPECT_OUTCOME_ERROR(MarketError::kInvalidPrice,
                         registry.list(runtime, collection, asset_id, 0, false));
  }

  /**
   * @given local listing
   * @when list again cross-chain at another price
   * @then listing is overwritten
   */
  TEST_F(ListingRegistryTest, Relist) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, false));
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, TokenAmount{price * 2}, true));
    EXPECT_EQ(listing().status, ListingStatus::kActiveCrosschain);
    EXPECT_EQ(listing().price, TokenAmount{price * 2});
  }

  /**
   * @given local and cross-chain listings
   * @when holder edits price
   * @then price changes, status does not
   */
  TEST_F(ListingRegistryTest, EditPriceKeepsStatus) {
    for (auto crosschain : {false, true}) {
      EXPECT_OUTCOME_TRUE_1(
          registry.list(runtime, collection, asset_id, price, crosschain));
      auto status{listing().status};
      EXPECT_OUTCOME_TRUE_1(
          registry.editPrice(
              runtime, collection, asset_id, TokenAmount{price + 5}));
      EXPECT_EQ(listing().status, status);
      EXPECT_EQ(listing().price, TokenAmount{price + 5});
    }
    EXPECT_EQ(eventsOf<PriceEdited>().size(), 2);
  }

  /**
   * @given listing
   * @when non-holder edits price or delists
   * @then kNotTokenOwner and listing unchanged
   */
  TEST_F(ListingRegistryTest, NonHolderCannotEditOrDelist) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, false));
    caller = stranger;
    EXPECT_OUTCOME_ERROR(
        MarketError::kNotTokenOwner,
        registry.editPrice(
            runtime, collection, asset_id, TokenAmount{price + 1}));
    EXPECT_OUTCOME_ERROR(MarketError::kNotTokenOwner,
                         registry.delist(runtime, collection, asset_id));
    EXPECT_EQ(listing().status, ListingStatus::kActiveLocal);
    EXPECT_EQ(listing().price, price);
  }

  /**
   * @given listing
   * @when holder edits price to zero
   * @then kInvalidPrice
   */
  TEST_F(ListingRegistryTest, EditPriceZero) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, false));
    EXPECT_OUTCOME_ERROR(MarketError::kInvalidPrice,
                         registry.editPrice(runtime, collection, asset_id, 0));
  }

  /**
   * @given inactive listing
   * @when holder edits price
   * @then kListingNotActive
   */
  TEST_F(ListingRegistryTest, EditPriceInactive) {
    EXPECT_OUTCOME_ERROR(
        MarketError::kListingNotActive,
        registry.editPrice(runtime, collection, asset_id, price));
  }

  /**
   * @given listing
   * @when holder delists
   * @then listing is INACTIVE and Delisted emitted
   */
  TEST_F(ListingRegistryTest, Delist) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, true));
    EXPECT_OUTCOME_TRUE_1(registry.delist(runtime, collection, asset_id));
    EXPECT_EQ(listing().status, ListingStatus::kInactive);
    ASSERT_EQ(eventsOf<Delisted>().size(), 1);
    EXPECT_EQ(eventsOf<Delisted>()[0].key, key);
  }

  /**
   * @given asset transferred to a new holder after listing
   * @when new holder delists
   * @then listing is INACTIVE
   */
  TEST_F(ListingRegistryTest, NewHolderDelists) {
    EXPECT_OUTCOME_TRUE_1(
        registry.list(runtime, collection, asset_id, price, false));
    holderIs(buyer);
    caller = buyer;
    EXPECT_OUTCOME_TRUE_1(registry.delist(runtime, collection, asset_id));
    EXPECT_FALSE(listing().isActive());
  }

}  // namespace xm::market
