/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/payload/word.hpp"
#include "primitives/types.hpp"

namespace xm::codec::payload {
  using primitives::TokenId;

  /**
   * Purchase intent carried by a relay message from the buyer's ledger to the
   * asset's home ledger
   */
  struct PurchasePayload {
    Address asset_contract;
    TokenId asset_id;
    Address recipient;

    inline bool operator==(const PurchasePayload &other) const {
      return asset_contract == other.asset_contract
             && asset_id == other.asset_id && recipient == other.recipient;
    }
  };

  /// Encoded payload is exactly three words
  constexpr size_t kPurchasePayloadSize{3 * kWordSize};

  outcome::result<Bytes> encode(const PurchasePayload &payload);

  outcome::result<PurchasePayload> decodePurchase(BytesIn bytes);
}  // namespace xm::codec::payload
