/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xm::ledger {
  using primitives::TokenId;
  using primitives::address::Address;

  /**
   * Asset-transfer primitive: the NFT collections deployed on a ledger
   */
  class NonFungibleTokens {
   public:
    virtual ~NonFungibleTokens() = default;

    /**
     * Current holder of an asset
     * @param collection - asset contract
     * @param token_id - asset id inside the collection
     */
    virtual outcome::result<Address> ownerOf(const Address &collection,
                                             const TokenId &token_id) const = 0;

    /// Whether operator may transfer every asset of owner in collection
    virtual bool isApprovedForAll(const Address &collection,
                                  const Address &owner,
                                  const Address &op) const = 0;

    /// Standing multi-asset approval granted by owner to operator
    virtual outcome::result<void> setApprovalForAll(const Address &collection,
                                                    const Address &owner,
                                                    const Address &op,
                                                    bool approved) = 0;

    /**
     * Transfer-on-behalf
     * @param collection - asset contract
     * @param op - account performing the transfer, the holder itself or an
     * approved operator
     * @param from - current holder
     * @param to - new holder
     * @param token_id - asset id
     */
    virtual outcome::result<void> transferFrom(const Address &collection,
                                               const Address &op,
                                               const Address &from,
                                               const Address &to,
                                               const TokenId &token_id) = 0;
  };
}  // namespace xm::ledger
