/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace xm::market {
  using primitives::BasisPoints;
  using primitives::kBasisPointsDenominator;
  using primitives::TokenAmount;

  template <typename T>
  struct Bounds {
    bool in(const T &value) const {
      return min <= value && value <= max;
    }

    T min;
    T max;
  };

  /**
   * Expected loss of a native -> stable -> native round trip and the accepted
   * deviation from it
   */
  struct ConversionPolicy {
    BasisPoints round_trip_cost_bps{60};
    BasisPoints tolerance_bps{50};
  };

  /// Fees held by the marketplace, per currency
  struct AccruedFees {
    TokenAmount native;
    TokenAmount wrapped;
  };

  bool isValidFeeRate(BasisPoints fee_bps);

  bool isValid(const ConversionPolicy &policy);

  /// price * fee_bps / 10000, rounded down
  TokenAmount feeAmount(const TokenAmount &price, BasisPoints fee_bps);

  TokenAmount netToSeller(const TokenAmount &price, BasisPoints fee_bps);

  /// Native amount a round-tripped sale at price is expected to yield
  TokenAmount expectedInbound(const TokenAmount &price,
                              const ConversionPolicy &policy);

  /// Swap floor for the inbound stable -> wrapped native conversion
  TokenAmount minimumInbound(const TokenAmount &price,
                             const ConversionPolicy &policy);

  /**
   * Accepted realized amounts for a sale at price: expected inbound amount
   * plus or minus tolerance. Lower bound equals the swap floor.
   */
  Bounds<TokenAmount> toleranceBand(const TokenAmount &price,
                                    const ConversionPolicy &policy);

}  // namespace xm::market
