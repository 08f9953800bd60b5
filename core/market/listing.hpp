/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/blob.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xm::market {
  using common::Hash256;
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;

  /// Listing key, hash of asset contract and asset id
  using ListingKey = Hash256;

  enum class ListingStatus : uint8_t {
    kInactive = 0,
    kActiveLocal,
    kActiveCrosschain,
  };

  struct Listing {
    Address seller;
    Address asset_contract;
    TokenId asset_id;
    TokenAmount price;
    ListingStatus status{ListingStatus::kInactive};

    bool isActive() const {
      return status != ListingStatus::kInactive;
    }
  };

  /**
   * SHA-256 over the 20 address bytes followed by the asset id as a 32-byte
   * big-endian word
   * @return key, or encode error for an asset id outside uint256
   */
  outcome::result<ListingKey> makeListingKey(const Address &asset_contract,
                                             const TokenId &asset_id);

  std::string toString(ListingStatus status);

}  // namespace xm::market
