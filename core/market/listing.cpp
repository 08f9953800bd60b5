/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "market/listing.hpp"

#include "codec/payload/word.hpp"
#include "crypto/sha/sha256.hpp"

namespace xm::market {

  outcome::result<ListingKey> makeListingKey(const Address &asset_contract,
                                             const TokenId &asset_id) {
    Bytes preimage{asset_contract.begin(), asset_contract.end()};
    OUTCOME_TRY(codec::payload::encodeUint256(asset_id, preimage));
    return crypto::sha::sha256(preimage);
  }

  std::string toString(ListingStatus status) {
    switch (status) {
      case ListingStatus::kInactive:
        return "INACTIVE";
      case ListingStatus::kActiveLocal:
        return "ACTIVE_LOCAL";
      case ListingStatus::kActiveCrosschain:
        return "ACTIVE_CROSSCHAIN";
    }
    return "UNKNOWN";
  }

}  // namespace xm::market
