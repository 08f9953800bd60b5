/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/variant.hpp>

#include "common/blob.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xm::ledger {
  using common::Hash256;
  using primitives::ChainId;
  using primitives::Nonce;
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;

  /// Listing status as written to the event log
  enum class ListedStatus : uint8_t { kLocal = 1, kCrosschain };

  struct Listed {
    Hash256 key;
    Address seller;
    Address asset_contract;
    TokenId asset_id;
    TokenAmount price;
    ListedStatus status{};
  };

  struct PriceEdited {
    Hash256 key;
    TokenAmount price;
  };

  struct Delisted {
    Hash256 key;
  };

  struct LocalPurchase {
    Hash256 key;
    Address buyer;
    Address recipient;
    Address seller;
    TokenAmount price;
    TokenAmount fee;
  };

  struct CrosschainPurchaseSent {
    ChainId dst_chain_id{};
    /** Relay-assigned message id for external tracking */
    Hash256 guid;
    Nonce nonce{};
    Address asset_contract;
    TokenId asset_id;
    Address recipient;
    TokenAmount stable_amount;
    TokenAmount relay_fee;
  };

  struct CrosschainPurchaseFinalized {
    Hash256 key;
    ChainId src_chain_id{};
    Nonce nonce{};
    Address recipient;
    Address seller;
    /** Wrapped native obtained from the bridged stable amount */
    TokenAmount realized_amount;
    TokenAmount fee;
  };

  /**
   * Bridged funds arrived but the purchase could not be settled, funds stay in
   * the marketplace as an unsettled receipt
   */
  struct FinalizationFailed {
    ChainId src_chain_id{};
    Nonce nonce{};
    Hash256 key;
    Address token;
    TokenAmount amount;
    std::string reason;
  };

  struct FeesWithdrawn {
    Address to;
    TokenAmount native_amount;
    TokenAmount wrapped_amount;
  };

  using Event = boost::variant<Listed,
                               PriceEdited,
                               Delisted,
                               LocalPurchase,
                               CrosschainPurchaseSent,
                               CrosschainPurchaseFinalized,
                               FinalizationFailed,
                               FeesWithdrawn>;

  /// Event together with the contract which emitted it
  struct LogEntry {
    Address emitter;
    Event event;
  };

  /// Event name and its key fields, one line
  std::string describe(const Event &event);
}  // namespace xm::ledger
