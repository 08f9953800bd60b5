/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "market/inbound_finalizer.hpp"
#include "market/local_settlement.hpp"
#include "market/outbound_initiator.hpp"

namespace xm::market {
  using ledger::RelayReceiver;

  /**
   * Marketplace instance on one ledger. Every state-changing method is one
   * ledger call: the caller is the immediate caller of runtime and an error
   * reverts the whole call.
   */
  class Marketplace : public RelayReceiver {
   public:
    Marketplace(std::shared_ptr<MarketConfig> config,
                std::shared_ptr<NonFungibleTokens> nft,
                std::shared_ptr<FungibleTokens> tokens,
                std::shared_ptr<WrappedNative> wrapped_native,
                std::shared_ptr<SwapRouter> swap_router,
                std::shared_ptr<RelayEndpoint> relay);

    outcome::result<ListingKey> list(Runtime &runtime,
                                     const Address &asset_contract,
                                     const TokenId &asset_id,
                                     const TokenAmount &price,
                                     bool crosschain);

    outcome::result<void> editPrice(Runtime &runtime,
                                    const Address &asset_contract,
                                    const TokenId &asset_id,
                                    const TokenAmount &new_price);

    outcome::result<void> delist(Runtime &runtime,
                                 const Address &asset_contract,
                                 const TokenId &asset_id);

    Listing getListing(const ListingKey &key) const;

    outcome::result<Listing> getListing(const Address &asset_contract,
                                        const TokenId &asset_id) const;

    outcome::result<ledger::LocalPurchase> buyLocal(
        Runtime &runtime,
        const Address &asset_contract,
        const TokenId &asset_id,
        const Address &recipient);

    outcome::result<MessagingFee> quoteRelayFee(ChainId dst_chain_id,
                                                const Address &asset_contract,
                                                const TokenId &asset_id,
                                                const Address &recipient,
                                                const Bytes &options) const;

    outcome::result<MessagingReceipt> buyCrosschain(
        Runtime &runtime,
        ChainId dst_chain_id,
        const Address &asset_contract,
        const TokenId &asset_id,
        const Address &recipient,
        const TokenAmount &price,
        const TokenAmount &min_stable_out,
        const Bytes &options);

    outcome::result<void> onRelayReceive(Runtime &runtime,
                                         const RelayMessage &message) override;

    /// Owner only
    outcome::result<void> retryFinalization(Runtime &runtime,
                                            ChainId src_chain_id,
                                            Nonce nonce);

    /**
     * Pays accrued native fees in native value and accrued wrapped-native
     * fees in wrapped native
     * @param runtime - call context, caller must be owner
     * @param to - payee
     */
    outcome::result<void> withdrawFees(Runtime &runtime, const Address &to);

    outcome::result<void> transferOwnership(Runtime &runtime,
                                            const Address &new_owner);

    outcome::result<void> addApprovedContract(Runtime &runtime,
                                              const Address &asset_contract);

    outcome::result<void> removeApprovedContract(
        Runtime &runtime, const Address &asset_contract);

    outcome::result<void> setTrustedPeer(Runtime &runtime,
                                         ChainId chain_id,
                                         const Bytes &peer);

    outcome::result<void> removeTrustedPeer(Runtime &runtime,
                                            ChainId chain_id);

    outcome::result<void> setFeeBps(Runtime &runtime, BasisPoints fee_bps);

    outcome::result<void> setConversionPolicy(Runtime &runtime,
                                              const ConversionPolicy &policy);

    const MarketConfig &config() const;

    const AccruedFees &accruedFees() const;

    boost::optional<UnsettledReceipt> unsettledReceipt(ChainId src_chain_id,
                                                       Nonce nonce) const;

   private:
    std::shared_ptr<MarketConfig> config_;
    std::shared_ptr<FungibleTokens> tokens_;
    std::shared_ptr<AccruedFees> fees_;
    std::shared_ptr<ListingRegistry> registry_;
    LocalSettlement local_;
    OutboundInitiator outbound_;
    InboundFinalizer inbound_;
    common::Logger logger_;
  };

}  // namespace xm::market
