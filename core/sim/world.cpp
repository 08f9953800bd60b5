/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sim/world.hpp"

namespace xm::sim {
  using market::Deployment;
  using market::MarketConfig;
  using primitives::Timestamp;

  namespace {
    constexpr uint64_t kOwnerId{1};
    constexpr uint64_t kMarketId{2};
    constexpr uint64_t kWrappedTokenId{3};
    constexpr uint64_t kStableTokenId{4};
    constexpr uint64_t kRouterId{5};
    constexpr uint64_t kEndpointId{6};
    constexpr Timestamp kSwapDeadlineWindow{300};
  }  // namespace

  Address chainAddress(ChainId chain_id, uint64_t n) {
    return Address::makeFromId((uint64_t{chain_id} << 32) + n);
  }

  outcome::result<std::shared_ptr<ChainNode>> ChainNode::create(
      ChainId chain_id, const WorldParams &params) {
    auto node{std::make_shared<ChainNode>()};
    node->chain_id = chain_id;
    node->owner = chainAddress(chain_id, kOwnerId);
    node->market = chainAddress(chain_id, kMarketId);
    node->wrapped_token = chainAddress(chain_id, kWrappedTokenId);
    node->stable_token = chainAddress(chain_id, kStableTokenId);
    node->router_address = chainAddress(chain_id, kRouterId);
    node->endpoint_address = chainAddress(chain_id, kEndpointId);

    node->ledger = std::make_shared<InMemoryLedger>(chain_id);
    node->tokens = std::make_shared<InMemoryTokens>(node->ledger);
    node->nft = std::make_shared<InMemoryNft>(node->ledger);
    node->wrapped = std::make_shared<InMemoryWrappedNative>(
        node->ledger, node->tokens, node->wrapped_token);
    node->router = std::make_shared<FixedRateSwapRouter>(
        node->ledger, node->tokens, node->router_address);
    node->endpoint =
        std::make_shared<InMemoryRelayEndpoint>(node->ledger,
                                                node->tokens,
                                                node->endpoint_address,
                                                node->stable_token,
                                                params.relay_fee);

    const TokenAmount stable_per_native{params.stable_per_native * kStableUnit};
    node->router->setRate(node->wrapped_token,
                          node->stable_token,
                          {stable_per_native, primitives::kOneNative});
    node->router->setRate(node->stable_token,
                          node->wrapped_token,
                          {primitives::kOneNative, stable_per_native});
    node->ledger->mintNative(node->router_address, params.router_liquidity);
    OUTCOME_TRY(node->wrapped->deposit(node->router_address,
                                       params.router_liquidity));
    OUTCOME_TRY(node->tokens->mint(
        node->stable_token,
        node->router_address,
        params.router_liquidity * stable_per_native / primitives::kOneNative));

    auto config{std::make_shared<MarketConfig>(
        Deployment{node->owner,
                   node->endpoint_address,
                   node->wrapped_token,
                   node->stable_token,
                   params.pool_fee,
                   kSwapDeadlineWindow})};
    node->marketplace = std::make_shared<Marketplace>(config,
                                                      node->nft,
                                                      node->tokens,
                                                      node->wrapped,
                                                      node->router,
                                                      node->endpoint);
    node->endpoint->registerReceiver(node->market, node->marketplace);

    OUTCOME_TRY(node->call(
        node->owner,
        0,
        [&](Marketplace &marketplace,
            Runtime &runtime) -> outcome::result<void> {
          OUTCOME_TRY(marketplace.setFeeBps(runtime, params.fee_bps));
          return marketplace.setConversionPolicy(runtime,
                                                 params.conversion_policy);
        }));
    return std::move(node);
  }

  outcome::result<World> World::create(ChainId home_chain_id,
                                       ChainId remote_chain_id,
                                       const WorldParams &params) {
    World world;
    OUTCOME_TRYA(world.home, ChainNode::create(home_chain_id, params));
    OUTCOME_TRYA(world.remote, ChainNode::create(remote_chain_id, params));
    world.network = std::make_shared<RelayNetwork>();
    world.network->connect(world.home->endpoint);
    world.network->connect(world.remote->endpoint);

    for (const auto &pair : {std::make_pair(world.home, world.remote),
                             std::make_pair(world.remote, world.home)}) {
      const auto &node{pair.first};
      const auto &peer{pair.second};
      OUTCOME_TRY(node->call(
          node->owner, 0, [&](Marketplace &marketplace, Runtime &runtime) {
            return marketplace.setTrustedPeer(
                runtime, peer->chain_id, peer->market.toPeerBytes());
          }));
    }
    return std::move(world);
  }

}  // namespace xm::sim
