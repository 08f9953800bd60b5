/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/payload/purchase_payload.hpp"

namespace xm::codec::payload {

  outcome::result<Bytes> encode(const PurchasePayload &payload) {
    Bytes out;
    out.reserve(kPurchasePayloadSize);
    encodeAddress(payload.asset_contract, out);
    OUTCOME_TRY(encodeUint256(payload.asset_id, out));
    encodeAddress(payload.recipient, out);
    return out;
  }

  outcome::result<PurchasePayload> decodePurchase(BytesIn bytes) {
    if (bytes.size() != kPurchasePayloadSize) {
      return PayloadDecodeError::kWrongSize;
    }
    PurchasePayload payload;
    OUTCOME_TRYA(payload.asset_contract,
                 decodeAddress(bytes.subspan(0, kWordSize)));
    OUTCOME_TRYA(payload.asset_id,
                 decodeUint256(bytes.subspan(kWordSize, kWordSize)));
    OUTCOME_TRYA(payload.recipient,
                 decodeAddress(bytes.subspan(2 * kWordSize, kWordSize)));
    return payload;
  }

}  // namespace xm::codec::payload
