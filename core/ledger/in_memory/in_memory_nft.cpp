/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/in_memory_nft.hpp"

#include "ledger/in_memory/ledger_error.hpp"

namespace xm::ledger::in_memory {

  InMemoryNft::InMemoryNft(std::shared_ptr<InMemoryLedger> ledger)
      : ledger_{std::move(ledger)} {}

  outcome::result<Address> InMemoryNft::ownerOf(
      const Address &collection, const TokenId &token_id) const {
    const auto &owners{ledger_->state().nft_owners};
    auto it{owners.find(collection)};
    if (it != owners.end()) {
      auto owner{it->second.find(token_id)};
      if (owner != it->second.end()) {
        return owner->second;
      }
    }
    return LedgerError::kTokenNotFound;
  }

  bool InMemoryNft::isApprovedForAll(const Address &collection,
                                     const Address &owner,
                                     const Address &op) const {
    const auto &operators{ledger_->state().operators};
    auto it{operators.find(collection)};
    return it != operators.end()
           && it->second.count(std::make_pair(owner, op)) != 0;
  }

  outcome::result<void> InMemoryNft::setApprovalForAll(
      const Address &collection,
      const Address &owner,
      const Address &op,
      bool approved) {
    auto &operators{ledger_->state().operators[collection]};
    if (approved) {
      operators.emplace(owner, op);
    } else {
      operators.erase(std::make_pair(owner, op));
    }
    return outcome::success();
  }

  outcome::result<void> InMemoryNft::transferFrom(const Address &collection,
                                                  const Address &op,
                                                  const Address &from,
                                                  const Address &to,
                                                  const TokenId &token_id) {
    OUTCOME_TRY(owner, ownerOf(collection, token_id));
    if (owner != from) {
      return LedgerError::kWrongTokenOwner;
    }
    if (op != from && !isApprovedForAll(collection, from, op)) {
      return LedgerError::kNotAuthorized;
    }
    ledger_->state().nft_owners[collection][token_id] = to;
    return outcome::success();
  }

  void InMemoryNft::mint(const Address &collection,
                         const Address &to,
                         const TokenId &token_id) {
    ledger_->state().nft_owners[collection][token_id] = to;
  }

}  // namespace xm::ledger::in_memory
