/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "ledger/swap_router.hpp"
#include "market/fee_policy.hpp"
#include "market/market_error.hpp"
#include "primitives/address/address.hpp"

namespace xm::market {
  using ledger::PoolFee;
  using primitives::ChainId;
  using primitives::Timestamp;
  using primitives::address::Address;

  /**
   * Addresses and swap parameters fixed at deployment
   */
  struct Deployment {
    Address owner;
    Address relay_endpoint;
    Address wrapped_native;
    /** Stable token bridged by the relay */
    Address stable_token;
    PoolFee pool_fee{3000};
    /** Swap deadline is current time plus this window */
    Timestamp swap_deadline_window{300};
  };

  /**
   * Access and trust configuration of one marketplace instance. Mutators are
   * owner-gated, every component reads the live values.
   */
  class MarketConfig {
   public:
    explicit MarketConfig(Deployment deployment);

    const Address &owner() const;

    outcome::result<void> transferOwnership(const Address &caller,
                                            const Address &new_owner);

    outcome::result<void> addApprovedContract(const Address &caller,
                                              const Address &asset_contract);

    outcome::result<void> removeApprovedContract(
        const Address &caller, const Address &asset_contract);

    bool isApprovedContract(const Address &asset_contract) const;

    /**
     * Registers the marketplace instance on another ledger
     * @param caller - must be owner
     * @param chain_id - relay id of the other ledger
     * @param peer - peer address bytes as the relay reports them
     */
    outcome::result<void> setTrustedPeer(const Address &caller,
                                         ChainId chain_id,
                                         const Bytes &peer);

    outcome::result<void> removeTrustedPeer(const Address &caller,
                                            ChainId chain_id);

    boost::optional<Bytes> trustedPeer(ChainId chain_id) const;

    /// Fee rate, at most the basis point denominator
    outcome::result<void> setFeeBps(const Address &caller, BasisPoints fee_bps);

    BasisPoints feeBps() const;

    outcome::result<void> setConversionPolicy(const Address &caller,
                                              const ConversionPolicy &policy);

    const ConversionPolicy &conversionPolicy() const;

    const Address &relayEndpoint() const;

    const Address &wrappedNative() const;

    const Address &stableToken() const;

    PoolFee poolFee() const;

    Timestamp swapDeadlineWindow() const;

   private:
    outcome::result<void> requireOwner(const Address &caller) const;

    Deployment deployment_;
    std::set<Address> approved_contracts_;
    std::map<ChainId, Bytes> peers_;
    BasisPoints fee_bps_{};
    ConversionPolicy conversion_policy_;
    common::Logger logger_;
  };

}  // namespace xm::market
