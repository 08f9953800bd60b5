/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xm::market {

  enum class MarketError {
    kNotApprovedNFT = 1,
    kNotTokenOwner,
    kNotActiveLocalListing,
    kInsufficientFunds,
    kExcessFunds,
    kUnknownDestination,
    kUntrustedSender,
    kSwapFailed,
    kNotOwner,
    kInvalidPrice,
    kNotRelayEndpoint,
    kStaleListing,
    kMalformedPayload,
    kUnexpectedBridgeToken,
    kZeroSlippageFloor,
    kInvalidFeeRate,
    kInvalidConversionPolicy,
    kUnknownReceipt,
    kNothingToWithdraw,
    kListingNotActive,
  };

  /**
   * Replaces error of res with error, keeps value
   * @tparam T - result type
   * @param res - collaborator result
   * @param error - error kind exposed by the marketplace
   */
  template <typename T>
  outcome::result<T> changeError(outcome::result<T> &&res, MarketError error) {
    if (res.has_error()) {
      return error;
    }
    return std::move(res);
  }

}  // namespace xm::market

OUTCOME_HPP_DECLARE_ERROR(xm::market, MarketError);
