/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ledger/in_memory/fixed_rate_swap_router.hpp"
#include "ledger/in_memory/in_memory_nft.hpp"
#include "ledger/in_memory/in_memory_relay.hpp"
#include "market/marketplace.hpp"

namespace xm::sim {
  using ledger::Runtime;
  using ledger::in_memory::FixedRateSwapRouter;
  using ledger::in_memory::InMemoryLedger;
  using ledger::in_memory::InMemoryNft;
  using ledger::in_memory::InMemoryRelayEndpoint;
  using ledger::in_memory::InMemoryTokens;
  using ledger::in_memory::InMemoryWrappedNative;
  using ledger::in_memory::RelayFeeModel;
  using ledger::in_memory::RelayNetwork;
  using market::ConversionPolicy;
  using market::Marketplace;
  using primitives::BasisPoints;
  using primitives::ChainId;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Stable token has 6 decimals
  inline const TokenAmount kStableUnit{1000000};

  struct WorldParams {
    BasisPoints fee_bps{250};
    /** Round trip crosses two pools of pool_fee, 2 * 0.05% */
    ConversionPolicy conversion_policy{10, 50};
    ledger::PoolFee pool_fee{500};
    /** Whole stable units per whole native unit */
    uint64_t stable_per_native{2000};
    RelayFeeModel relay_fee{TokenAmount{"100000000000000"},
                            TokenAmount{"1000000000"}};
    /** Native value worth of each token the router holds on every chain */
    TokenAmount router_liquidity{primitives::kOneNative * 1000};
  };

  /// Deterministic address of account n on chain
  Address chainAddress(ChainId chain_id, uint64_t n);

  /**
   * One simulated ledger with its token contracts, swap venue, relay
   * endpoint and marketplace instance
   */
  struct ChainNode {
    static outcome::result<std::shared_ptr<ChainNode>> create(
        ChainId chain_id, const WorldParams &params);

    /**
     * Calls the marketplace as one ledger call
     * @param caller - immediate caller
     * @param value - attached native value
     * @param f - (Marketplace &, Runtime &) -> outcome::result<T>
     */
    template <typename F>
    auto call(const Address &caller, const TokenAmount &value, F &&f) {
      return ledger->execute(caller, value, market, [&](Runtime &runtime) {
        return f(*marketplace, runtime);
      });
    }

    ChainId chain_id{};
    Address owner;
    Address market;
    Address wrapped_token;
    Address stable_token;
    Address router_address;
    Address endpoint_address;
    std::shared_ptr<InMemoryLedger> ledger;
    std::shared_ptr<InMemoryTokens> tokens;
    std::shared_ptr<InMemoryNft> nft;
    std::shared_ptr<InMemoryWrappedNative> wrapped;
    std::shared_ptr<FixedRateSwapRouter> router;
    std::shared_ptr<InMemoryRelayEndpoint> endpoint;
    std::shared_ptr<Marketplace> marketplace;
  };

  /**
   * Two ledgers connected by a relay network, marketplace instances trust
   * each other
   */
  struct World {
    static outcome::result<World> create(ChainId home_chain_id,
                                         ChainId remote_chain_id,
                                         const WorldParams &params);

    /** Ledger holding the listed assets */
    std::shared_ptr<ChainNode> home;
    /** Ledger of cross-chain buyers */
    std::shared_ptr<ChainNode> remote;
    std::shared_ptr<RelayNetwork> network;
  };

}  // namespace xm::sim
