/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include "codec/payload/purchase_payload.hpp"
#include "ledger/fungible_tokens.hpp"
#include "ledger/relay.hpp"
#include "ledger/swap_router.hpp"
#include "market/listing_registry.hpp"

namespace xm::market {
  using codec::payload::PurchasePayload;
  using ledger::FungibleTokens;
  using ledger::RelayMessage;
  using ledger::SwapRouter;
  using primitives::Nonce;

  /**
   * Bridged funds of a purchase that could not be settled, kept in the
   * marketplace until retried or reconciled by the owner
   */
  struct UnsettledReceipt {
    ChainId src_chain_id{};
    Nonce nonce{};
    ListingKey key;
    PurchasePayload purchase;
    /** Token currently holding the value, stable or wrapped native */
    Address token;
    TokenAmount amount;
    std::string reason;
  };

  /// Unsettled receipts are keyed by source chain and relay nonce
  using ReceiptKey = std::pair<ChainId, Nonce>;

  /**
   * Completes cross-chain purchases of listings placed into ACTIVE_CROSSCHAIN
   * by this marketplace instance. Only the first valid message for a listing
   * is honored, and a message settles at most once.
   */
  class InboundFinalizer {
   public:
    InboundFinalizer(std::shared_ptr<MarketConfig> config,
                     std::shared_ptr<ListingRegistry> registry,
                     std::shared_ptr<NonFungibleTokens> nft,
                     std::shared_ptr<FungibleTokens> tokens,
                     std::shared_ptr<SwapRouter> swap_router,
                     std::shared_ptr<AccruedFees> fees);

    /**
     * Relay callback. Validation failures reject the message, settlement
     * failures leave the bridged funds as an unsettled receipt and succeed.
     * @param runtime - call context, caller must be the relay endpoint
     * @param message - delivered message, bridged amount already credited
     */
    outcome::result<void> onRelayReceive(Runtime &runtime,
                                         const RelayMessage &message);

    /**
     * Settles an unsettled receipt again, receipt is dropped on success
     * @param runtime - call context
     * @param src_chain_id - source chain of the message
     * @param nonce - relay nonce of the message
     */
    outcome::result<void> retry(Runtime &runtime,
                                ChainId src_chain_id,
                                Nonce nonce);

    boost::optional<UnsettledReceipt> unsettledReceipt(ChainId src_chain_id,
                                                       Nonce nonce) const;

    const std::map<ReceiptKey, UnsettledReceipt> &unsettledReceipts() const;

   private:
    /// Value held for a purchase while it is being settled
    struct Holding {
      Address token;
      TokenAmount amount;
    };

    outcome::result<ledger::CrosschainPurchaseFinalized> settle(
        Runtime &runtime,
        const ListingKey &key,
        const Listing &listing,
        const PurchasePayload &purchase,
        Holding &holding);

    std::shared_ptr<MarketConfig> config_;
    std::shared_ptr<ListingRegistry> registry_;
    std::shared_ptr<NonFungibleTokens> nft_;
    std::shared_ptr<FungibleTokens> tokens_;
    std::shared_ptr<SwapRouter> swap_router_;
    std::shared_ptr<AccruedFees> fees_;
    std::map<ReceiptKey, UnsettledReceipt> receipts_;
    /** Messages already settled, either on delivery or by retry */
    std::set<ReceiptKey> settled_;
    common::Logger logger_;
  };

}  // namespace xm::market
