/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/payload/purchase_payload.hpp"
#include "ledger/fungible_tokens.hpp"
#include "ledger/relay.hpp"
#include "ledger/swap_router.hpp"
#include "market/market_config.hpp"

namespace xm::market {
  using codec::payload::PurchasePayload;
  using ledger::FungibleTokens;
  using ledger::MessagingFee;
  using ledger::MessagingReceipt;
  using ledger::RelayEndpoint;
  using ledger::Runtime;
  using ledger::SwapRouter;
  using ledger::WrappedNative;

  /**
   * Starts a purchase of an asset listed on another ledger. Payment is
   * converted native -> wrapped native -> stable and bridged with the
   * purchase payload to the marketplace instance on the asset's ledger.
   */
  class OutboundInitiator {
   public:
    OutboundInitiator(std::shared_ptr<MarketConfig> config,
                      std::shared_ptr<FungibleTokens> tokens,
                      std::shared_ptr<WrappedNative> wrapped_native,
                      std::shared_ptr<SwapRouter> swap_router,
                      std::shared_ptr<RelayEndpoint> relay);

    /**
     * Relay fee for a purchase message, mirror of the relay fee model
     * @param dst_chain_id - asset's ledger
     * @param payload - purchase intent
     * @param options - relay options
     */
    outcome::result<MessagingFee> quoteRelayFee(ChainId dst_chain_id,
                                                const PurchasePayload &payload,
                                                BytesIn options) const;

    /**
     * Converts price to stable and dispatches the purchase. Attached value
     * must cover price plus relay fee, the unused fee is refunded to the
     * caller by the relay.
     * @param runtime - call context, value attached by the buyer
     * @param dst_chain_id - asset's ledger, must have a trusted peer
     * @param payload - purchase intent
     * @param price - listing price in native units
     * @param min_stable_out - non-zero slippage floor of the conversion
     * @param options - relay options
     * @return relay receipt
     */
    outcome::result<MessagingReceipt> buy(Runtime &runtime,
                                          ChainId dst_chain_id,
                                          const PurchasePayload &payload,
                                          const TokenAmount &price,
                                          const TokenAmount &min_stable_out,
                                          const Bytes &options);

   private:
    std::shared_ptr<MarketConfig> config_;
    std::shared_ptr<FungibleTokens> tokens_;
    std::shared_ptr<WrappedNative> wrapped_native_;
    std::shared_ptr<SwapRouter> swap_router_;
    std::shared_ptr<RelayEndpoint> relay_;
    common::Logger logger_;
  };

}  // namespace xm::market
