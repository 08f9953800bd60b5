/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/outbound_initiator.hpp"

#include "ledger/in_memory/ledger_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/market/market_test_fixture.hpp"

namespace xm::market {
  using ledger::CrosschainPurchaseSent;
  using ledger::ExactInputSingleParams;
  using ledger::RelaySendParams;
  using ledger::in_memory::LedgerError;
  using testing::_;
  using testing::DoAll;
  using testing::InSequence;
  using testing::Return;
  using testing::SaveArg;
  using testutil::MarketTestFixture;

  struct OutboundInitiatorTest : MarketTestFixture {
    void SetUp() override {
      MarketTestFixture::SetUp();
      asOwner([&](MarketConfig &config, const Address &owner) {
        return config.setTrustedPeer(
            owner, remote_chain_id, remote_market.toPeerBytes());
      });
      caller = buyer;
      value = TokenAmount{price + relay_fee};
      payload = PurchasePayload{collection, asset_id, buyer};
      encoded = codec::payload::encode(payload).value();
      ON_CALL_3(*relay, quote(remote_chain_id, _, _), MessagingFee{relay_fee});
    }

    /// Expects the whole conversion and dispatch pipeline to succeed
    void expectPipeline() {
      InSequence seq;
      EXPECT_CALL(*wrapped_native, deposit(self, price))
          .WillOnce(Return(outcome::success()));
      EXPECT_CALL(*tokens, approve(wrapped_token, self, router_address, price))
          .WillOnce(Return(outcome::success()));
      EXPECT_CALL(*swap_router, exactInputSingle(self, _))
          .WillOnce(DoAll(SaveArg<1>(&swap),
                          Return(outcome::result<TokenAmount>{stable_out})));
      EXPECT_CALL(*tokens,
                  approve(stable_token, self, endpoint_address, stable_out))
          .WillOnce(Return(outcome::success()));
      EXPECT_CALL(*relay, send(self, _, _))
          .WillOnce(DoAll(SaveArg<1>(&sent),
                          SaveArg<2>(&sent_fee),
                          Return(outcome::result<MessagingReceipt>{receipt})));
    }

    outcome::result<MessagingReceipt> buy() {
      return initiator.buy(
          runtime, remote_chain_id, payload, price, min_stable_out, {});
    }

    OutboundInitiator initiator{config, tokens, wrapped_native, swap_router,
                                relay};

    TokenAmount relay_fee{100000000000000};
    TokenAmount stable_out{1990000000};
    TokenAmount min_stable_out{1970000000};
    PurchasePayload payload;
    Bytes encoded;
    MessagingReceipt receipt{
        "0101010101010101010101010101010101010101010101010101010101010101"_hash256,
        1,
        MessagingFee{relay_fee}};

    ExactInputSingleParams swap;
    RelaySendParams sent;
    TokenAmount sent_fee;
  };

  /**
   * @given trusted remote peer and value of price plus relay fee
   * @when buy cross-chain
   * @then price is wrapped, swapped to stable with the floor and deadline,
   * and bridged to the peer with the encoded payload
   */
  TEST_F(OutboundInitiatorTest, Buy) {
    expectPipeline();
    EXPECT_OUTCOME_TRUE(result, buy());
    EXPECT_EQ(result.guid, receipt.guid);
    EXPECT_EQ(result.nonce, 1);

    EXPECT_EQ(swap.token_in, wrapped_token);
    EXPECT_EQ(swap.token_out, stable_token);
    EXPECT_EQ(swap.fee, 3000);
    EXPECT_EQ(swap.recipient, self);
    EXPECT_EQ(swap.deadline, now + 300);
    EXPECT_EQ(swap.amount_in, price);
    EXPECT_EQ(swap.amount_out_minimum, min_stable_out);

    EXPECT_EQ(sent.dst_chain_id, remote_chain_id);
    EXPECT_EQ(sent.receiver, remote_market.toPeerBytes());
    EXPECT_EQ(sent.payload, encoded);
    EXPECT_EQ(sent.refund_address, buyer);
    EXPECT_EQ(sent.token, stable_token);
    EXPECT_EQ(sent.amount, stable_out);
    EXPECT_EQ(sent_fee, relay_fee);

    auto emitted{eventsOf<CrosschainPurchaseSent>()};
    ASSERT_EQ(emitted.size(), 1);
    EXPECT_EQ(emitted[0].dst_chain_id, remote_chain_id);
    EXPECT_EQ(emitted[0].nonce, 1);
    EXPECT_EQ(emitted[0].asset_id, asset_id);
    EXPECT_EQ(emitted[0].recipient, buyer);
    EXPECT_EQ(emitted[0].stable_amount, stable_out);
    EXPECT_EQ(emitted[0].relay_fee, relay_fee);
  }

  /**
   * @given value above price plus relay fee
   * @when buy cross-chain
   * @then whole remainder is handed to the relay, which refunds the caller
   */
  TEST_F(OutboundInitiatorTest, ExcessValueGoesToRelay) {
    value = TokenAmount{price + relay_fee * 3};
    expectPipeline();
    EXPECT_OUTCOME_TRUE_1(buy());
    EXPECT_EQ(sent_fee, TokenAmount{relay_fee * 3});
    EXPECT_EQ(sent.refund_address, buyer);
  }

  /**
   * @given value below price plus relay fee
   * @when buy cross-chain
   * @then kInsufficientFunds and nothing is converted
   */
  TEST_F(OutboundInitiatorTest, InsufficientValue) {
    EXPECT_CALL(*wrapped_native, deposit(_, _)).Times(0);
    value = TokenAmount{price + relay_fee - 1};
    EXPECT_OUTCOME_ERROR(MarketError::kInsufficientFunds, buy());
    EXPECT_TRUE(events.empty());
  }

  /**
   * @given zero slippage floor
   * @when buy cross-chain
   * @then kZeroSlippageFloor
   */
  TEST_F(OutboundInitiatorTest, ZeroSlippageFloor) {
    min_stable_out = 0;
    EXPECT_OUTCOME_ERROR(MarketError::kZeroSlippageFloor, buy());
  }

  /**
   * @given zero price
   * @when buy cross-chain
   * @then kInvalidPrice
   */
  TEST_F(OutboundInitiatorTest, ZeroPrice) {
    EXPECT_OUTCOME_ERROR(
        MarketError::kInvalidPrice,
        initiator.buy(runtime, remote_chain_id, payload, 0, min_stable_out, {}));
  }

  /**
   * @given no trusted peer for the destination
   * @when buy cross-chain
   * @then kUnknownDestination
   */
  TEST_F(OutboundInitiatorTest, UnknownDestination) {
    EXPECT_OUTCOME_ERROR(
        MarketError::kUnknownDestination,
        initiator.buy(runtime, 999, payload, price, min_stable_out, {}));
  }

  /**
   * @given router output below the floor
   * @when buy cross-chain
   * @then kSwapFailed and nothing is sent
   */
  TEST_F(OutboundInitiatorTest, SwapFails) {
    EXPECT_CALL(*wrapped_native, deposit(self, price))
        .WillOnce(Return(outcome::success()));
    EXPECT_CALL(*tokens, approve(wrapped_token, self, router_address, price))
        .WillOnce(Return(outcome::success()));
    EXPECT_CALL(*swap_router, exactInputSingle(self, _))
        .WillOnce(Return(
            outcome::result<TokenAmount>{LedgerError::kTooLittleReceived}));
    EXPECT_CALL(*relay, send(_, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(MarketError::kSwapFailed, buy());
    EXPECT_TRUE(events.empty());
  }

  /**
   * @given relay rejects the message
   * @when buy cross-chain
   * @then relay error is returned and no event is emitted
   */
  TEST_F(OutboundInitiatorTest, RelayFails) {
    EXPECT_CALL(*wrapped_native, deposit(self, price))
        .WillOnce(Return(outcome::success()));
    EXPECT_CALL(*tokens, approve(_, _, _, _))
        .Times(2)
        .WillRepeatedly(Return(outcome::success()));
    EXPECT_CALL(*swap_router, exactInputSingle(self, _))
        .WillOnce(Return(outcome::result<TokenAmount>{stable_out}));
    EXPECT_CALL(*relay, send(self, _, _))
        .WillOnce(Return(outcome::result<MessagingReceipt>{
            LedgerError::kInsufficientRelayFee}));
    EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientRelayFee, buy());
    EXPECT_TRUE(events.empty());
  }

  /**
   * @given payload and options
   * @when quote relay fee
   * @then relay is asked with the encoded payload
   */
  TEST_F(OutboundInitiatorTest, QuoteRelayFee) {
    Bytes options{1, 2, 3};
    EXPECT_CALL(*relay, quote(remote_chain_id, BytesIn{encoded}, BytesIn{options}))
        .WillOnce(Return(outcome::result<MessagingFee>{MessagingFee{5}}));
    EXPECT_OUTCOME_TRUE(fee,
                        initiator.quoteRelayFee(remote_chain_id, payload, options));
    EXPECT_EQ(fee.native_fee, 5);
  }

}  // namespace xm::market
