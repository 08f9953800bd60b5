/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "ledger/in_memory/in_memory_ledger.hpp"
#include "ledger/non_fungible_tokens.hpp"

namespace xm::ledger::in_memory {

  /**
   * NFT collections of one simulated ledger
   */
  class InMemoryNft : public NonFungibleTokens {
   public:
    explicit InMemoryNft(std::shared_ptr<InMemoryLedger> ledger);

    outcome::result<Address> ownerOf(const Address &collection,
                                     const TokenId &token_id) const override;

    bool isApprovedForAll(const Address &collection,
                          const Address &owner,
                          const Address &op) const override;

    outcome::result<void> setApprovalForAll(const Address &collection,
                                            const Address &owner,
                                            const Address &op,
                                            bool approved) override;

    outcome::result<void> transferFrom(const Address &collection,
                                       const Address &op,
                                       const Address &from,
                                       const Address &to,
                                       const TokenId &token_id) override;

    /// Creates token_id in collection, overwriting any previous holder
    void mint(const Address &collection,
              const Address &to,
              const TokenId &token_id);

   private:
    std::shared_ptr<InMemoryLedger> ledger_;
  };

}  // namespace xm::ledger::in_memory
