/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/marketplace.hpp"

#include "testutil/market/market_test_fixture.hpp"

namespace xm::market {
  using ledger::FeesWithdrawn;
  using testing::_;
  using testing::Return;
  using testutil::MarketTestFixture;

  struct MarketplaceTest : MarketTestFixture {
    void SetUp() override {
      MarketTestFixture::SetUp();
      caller = owner;
      EXPECT_OUTCOME_TRUE_1(market.addApprovedContract(runtime, collection));
      EXPECT_OUTCOME_TRUE_1(market.setFeeBps(runtime, 250));
      holderIs(seller);
    }

    /// Local sale of asset_id at price, accrues 2.5% native fee
    void sellLocally() {
      caller = seller;
      EXPECT_OUTCOME_TRUE_1(
          market.list(runtime, collection, asset_id, price, false));
      EXPECT_CALL(*nft, transferFrom(collection, self, seller, buyer, asset_id))
          .WillOnce(Return(outcome::success()));
      EXPECT_CALL(runtime, sendFunds(seller, _))
          .WillOnce(Return(outcome::success()));
      caller = buyer;
      value = price;
      EXPECT_OUTCOME_TRUE_1(
          market.buyLocal(runtime, collection, asset_id, buyer));
      value = 0;
    }

    Marketplace market{
        config, nft, tokens, wrapped_native, swap_router, relay};
    TokenAmount fee{25000000000000000};
  };

  /**
   * @given marketplace set up by the owner
   * @when non-owner calls any admin operation
   * @then kNotOwner and configuration is unchanged
   */
  TEST_F(MarketplaceTest, AdminIsOwnerOnly) {
    caller = stranger;
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.transferOwnership(runtime, stranger));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.addApprovedContract(runtime, stranger));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.removeApprovedContract(runtime, collection));
    EXPECT_OUTCOME_ERROR(
        MarketError::kNotOwner,
        market.setTrustedPeer(runtime, remote_chain_id, stranger.toPeerBytes()));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.removeTrustedPeer(runtime, remote_chain_id));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner, market.setFeeBps(runtime, 0));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.setConversionPolicy(runtime, {}));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.retryFinalization(runtime, remote_chain_id, 1));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner,
                         market.withdrawFees(runtime, stranger));

    EXPECT_EQ(market.config().owner(), owner);
    EXPECT_TRUE(market.config().isApprovedContract(collection));
    EXPECT_EQ(market.config().feeBps(), 250);
  }

  /**
   * @given ownership transferred
   * @when old and new owner call admin operations
   * @then only the new owner succeeds
   */
  TEST_F(MarketplaceTest, TransferOwnership) {
    EXPECT_OUTCOME_TRUE_1(market.transferOwnership(runtime, stranger));
    EXPECT_OUTCOME_ERROR(MarketError::kNotOwner, market.setFeeBps(runtime, 0));
    caller = stranger;
    EXPECT_OUTCOME_TRUE_1(market.setFeeBps(runtime, 0));
    EXPECT_EQ(market.config().feeBps(), 0);
  }

  /**
   * @given no fees accrued
   * @when owner withdraws
   * @then kNothingToWithdraw
   */
  TEST_F(MarketplaceTest, NothingToWithdraw) {
    EXPECT_OUTCOME_ERROR(MarketError::kNothingToWithdraw,
                         market.withdrawFees(runtime, owner));
  }

  /**
   * @given native fee accrued by a local sale
   * @when owner withdraws to a treasury address
   * @then fees are paid out, event emitted and accrued fees reset
   */
  TEST_F(MarketplaceTest, WithdrawFees) {
    sellLocally();
    EXPECT_EQ(market.accruedFees().native, fee);
    EXPECT_EQ(market.getListing(collection, asset_id).value().status,
              ListingStatus::kInactive);

    caller = owner;
    EXPECT_CALL(runtime, sendFunds(stranger, fee))
        .WillOnce(Return(outcome::success()));
    EXPECT_CALL(*tokens, transfer(wrapped_token, self, stranger, TokenAmount{0}))
        .WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE_1(market.withdrawFees(runtime, stranger));

    auto withdrawn{eventsOf<FeesWithdrawn>()};
    ASSERT_EQ(withdrawn.size(), 1);
    EXPECT_EQ(withdrawn[0].to, stranger);
    EXPECT_EQ(withdrawn[0].native_amount, fee);
    EXPECT_EQ(withdrawn[0].wrapped_amount, 0);
    EXPECT_EQ(market.accruedFees().native, 0);
    EXPECT_OUTCOME_ERROR(MarketError::kNothingToWithdraw,
                         market.withdrawFees(runtime, stranger));
  }

  /**
   * @given native payout fails
   * @when owner withdraws
   * @then error returned and fees stay accrued
   */
  TEST_F(MarketplaceTest, WithdrawFeesFails) {
    sellLocally();
    caller = owner;
    EXPECT_CALL(runtime, sendFunds(stranger, fee))
        .WillOnce(Return(outcome::result<void>{MarketError::kInsufficientFunds}));
    EXPECT_OUTCOME_ERROR(MarketError::kInsufficientFunds,
                         market.withdrawFees(runtime, stranger));
    EXPECT_EQ(market.accruedFees().native, fee);
  }

  /**
   * @given owner
   * @when retry of an unknown receipt
   * @then kUnknownReceipt
   */
  TEST_F(MarketplaceTest, RetryUnknownReceipt) {
    EXPECT_OUTCOME_ERROR(MarketError::kUnknownReceipt,
                         market.retryFinalization(runtime, remote_chain_id, 1));
    EXPECT_FALSE(market.unsettledReceipt(remote_chain_id, 1));
  }

  /**
   * @given listing through the facade
   * @when seller edits price and delists
   * @then listing follows
   */
  TEST_F(MarketplaceTest, ListingLifecycle) {
    caller = seller;
    EXPECT_OUTCOME_TRUE(key,
                        market.list(runtime, collection, asset_id, price, true));
    EXPECT_OUTCOME_TRUE_1(market.editPrice(runtime, collection, asset_id, 5));
    EXPECT_EQ(market.getListing(key).price, 5);
    EXPECT_EQ(market.getListing(key).status, ListingStatus::kActiveCrosschain);
    EXPECT_OUTCOME_TRUE_1(market.delist(runtime, collection, asset_id));
    EXPECT_FALSE(market.getListing(key).isActive());
  }

}  // namespace xm::market
