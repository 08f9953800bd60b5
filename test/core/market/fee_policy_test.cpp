/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/fee_policy.hpp"

#include <gtest/gtest.h>

using xm::market::ConversionPolicy;
using xm::market::expectedInbound;
using xm::market::feeAmount;
using xm::market::isValid;
using xm::market::isValidFeeRate;
using xm::market::minimumInbound;
using xm::market::netToSeller;
using xm::market::toleranceBand;
using xm::primitives::kOneNative;
using xm::primitives::TokenAmount;

/**
 * @given 2.5% fee rate
 * @when compute fee of 1.0 native
 * @then fee is 0.025 native and seller receives the rest
 */
TEST(FeePolicyTest, FeeOfOneNative) {
  EXPECT_EQ(feeAmount(kOneNative, 250), TokenAmount{"25000000000000000"});
  EXPECT_EQ(netToSeller(kOneNative, 250), TokenAmount{"975000000000000000"});
}

/**
 * @given prices around the rounding boundary and a range of fee rates
 * @when split price into fee and net
 * @then fee + net == price, fee rounds down
 */
TEST(FeePolicyTest, FeeAndNetSumToPrice) {
  for (auto fee_bps : {0, 1, 30, 250, 9999, 10000}) {
    for (const TokenAmount &price :
         {TokenAmount{0}, TokenAmount{1}, TokenAmount{39}, TokenAmount{10001},
          kOneNative, TokenAmount{kOneNative * 12345 + 7}}) {
      const TokenAmount sum{feeAmount(price, fee_bps)
                            + netToSeller(price, fee_bps)};
      EXPECT_EQ(sum, price);
      EXPECT_LE(feeAmount(price, fee_bps), price);
    }
  }
  EXPECT_EQ(feeAmount(39, 250), 0);
  EXPECT_EQ(feeAmount(40, 250), 1);
}

/**
 * @given fee rates around the denominator
 * @when validate them
 * @then rates above 100% are invalid
 */
TEST(FeePolicyTest, FeeRateBounds) {
  EXPECT_TRUE(isValidFeeRate(0));
  EXPECT_TRUE(isValidFeeRate(10000));
  EXPECT_FALSE(isValidFeeRate(10001));
}

/**
 * @given default conversion policy, 60 bps round trip cost and 50 bps
 * tolerance
 * @when compute expected amount and floor for 1.0 native
 * @then expected is 0.994, floor is 0.994 * 0.995
 */
TEST(FeePolicyTest, DefaultConversionPolicy) {
  ConversionPolicy policy;
  EXPECT_EQ(expectedInbound(kOneNative, policy),
            TokenAmount{"994000000000000000"});
  EXPECT_EQ(minimumInbound(kOneNative, policy),
            TokenAmount{"989030000000000000"});
  auto band{toleranceBand(kOneNative, policy)};
  EXPECT_EQ(band.min, TokenAmount{"989030000000000000"});
  EXPECT_EQ(band.max, TokenAmount{"998970000000000000"});
  EXPECT_TRUE(band.in(expectedInbound(kOneNative, policy)));
  EXPECT_TRUE(band.in(band.min));
  EXPECT_TRUE(band.in(band.max));
  EXPECT_FALSE(band.in(TokenAmount{band.min - 1}));
  EXPECT_FALSE(band.in(TokenAmount{band.max + 1}));
}

/**
 * @given 10 bps round trip cost and 50 bps tolerance
 * @when check realized amounts of a 1.0 native sale
 * @then band is centred on 0.999, the full price is above it
 */
TEST(FeePolicyTest, BandCentredOnExpected) {
  ConversionPolicy policy{10, 50};
  auto band{toleranceBand(kOneNative, policy)};
  EXPECT_EQ(band.min, minimumInbound(kOneNative, policy));
  EXPECT_EQ(band.min, TokenAmount{"994005000000000000"});
  EXPECT_EQ(band.max, TokenAmount{"1003995000000000000"});
  EXPECT_TRUE(band.in(TokenAmount{"999000250000000000"}));
  EXPECT_FALSE(band.in(TokenAmount{"1003995000000000001"}));

  policy.round_trip_cost_bps = 60;
  EXPECT_FALSE(toleranceBand(kOneNative, policy)
                   .in(TokenAmount{"999000250000000000"}));
}

/**
 * @given conversion policies with values at and above the denominator
 * @when validate them
 * @then only values below the denominator are valid
 */
TEST(FeePolicyTest, ConversionPolicyBounds) {
  EXPECT_TRUE(isValid(ConversionPolicy{0, 0}));
  EXPECT_TRUE(isValid(ConversionPolicy{9999, 9999}));
  EXPECT_FALSE(isValid(ConversionPolicy{10000, 50}));
  EXPECT_FALSE(isValid(ConversionPolicy{60, 10000}));
}
