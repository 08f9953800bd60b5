/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/fee_policy.hpp"

namespace xm::market {

  namespace {
    TokenAmount applyBps(const TokenAmount &amount, BasisPoints bps) {
      return amount * bps / kBasisPointsDenominator;
    }
  }  // namespace

  bool isValidFeeRate(BasisPoints fee_bps) {
    return fee_bps <= kBasisPointsDenominator;
  }

  bool isValid(const ConversionPolicy &policy) {
    return policy.round_trip_cost_bps < kBasisPointsDenominator
           && policy.tolerance_bps < kBasisPointsDenominator;
  }

  TokenAmount feeAmount(const TokenAmount &price, BasisPoints fee_bps) {
    return applyBps(price, fee_bps);
  }

  TokenAmount netToSeller(const TokenAmount &price, BasisPoints fee_bps) {
    return price - feeAmount(price, fee_bps);
  }

  TokenAmount expectedInbound(const TokenAmount &price,
                              const ConversionPolicy &policy) {
    return price - applyBps(price, policy.round_trip_cost_bps);
  }

  TokenAmount minimumInbound(const TokenAmount &price,
                             const ConversionPolicy &policy) {
    auto expected{expectedInbound(price, policy)};
    return expected - applyBps(expected, policy.tolerance_bps);
  }

  Bounds<TokenAmount> toleranceBand(const TokenAmount &price,
                                    const ConversionPolicy &policy) {
    auto expected{expectedInbound(price, policy)};
    auto deviation{applyBps(expected, policy.tolerance_bps)};
    return {expected - deviation, expected + deviation};
  }

}  // namespace xm::market
