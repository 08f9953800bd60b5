/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/market_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xm::market, MarketError, e) {
  using xm::market::MarketError;
  switch (e) {
    case MarketError::kNotApprovedNFT:
      return "MarketError: asset contract is not approved for listing";
    case MarketError::kNotTokenOwner:
      return "MarketError: caller does not hold the asset";
    case MarketError::kNotActiveLocalListing:
      return "MarketError: listing is not active for local purchase";
    case MarketError::kInsufficientFunds:
      return "MarketError: attached value below required amount";
    case MarketError::kExcessFunds:
      return "MarketError: attached value above listing price";
    case MarketError::kUnknownDestination:
      return "MarketError: no trusted peer for destination chain";
    case MarketError::kUntrustedSender:
      return "MarketError: message sender is not the trusted peer";
    case MarketError::kSwapFailed:
      return "MarketError: swap failed";
    case MarketError::kNotOwner:
      return "MarketError: caller is not the marketplace owner";
    case MarketError::kInvalidPrice:
      return "MarketError: price must be positive";
    case MarketError::kNotRelayEndpoint:
      return "MarketError: caller is not the relay endpoint";
    case MarketError::kStaleListing:
      return "MarketError: listing is not active for cross-chain purchase";
    case MarketError::kMalformedPayload:
      return "MarketError: purchase payload cannot be decoded";
    case MarketError::kUnexpectedBridgeToken:
      return "MarketError: bridged token is not the stable token";
    case MarketError::kZeroSlippageFloor:
      return "MarketError: minimum swap output must be non-zero";
    case MarketError::kInvalidFeeRate:
      return "MarketError: fee rate above denominator";
    case MarketError::kInvalidConversionPolicy:
      return "MarketError: conversion policy out of range";
    case MarketError::kUnknownReceipt:
      return "MarketError: no unsettled receipt for source chain and nonce";
    case MarketError::kNothingToWithdraw:
      return "MarketError: no accrued fees";
    case MarketError::kListingNotActive:
      return "MarketError: listing is not active";
  }
  return "MarketError: unknown error";
}
