/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sim/scenarios.hpp"

#include "common/table_writer.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xm::sim, ScenarioError, e) {
  using xm::sim::ScenarioError;
  switch (e) {
    case ScenarioError::kUnknownScenario:
      return "ScenarioError: unknown scenario";
    case ScenarioError::kAssetNotDelivered:
      return "ScenarioError: asset is not held by the buyer";
    case ScenarioError::kListingStillActive:
      return "ScenarioError: listing is still active";
    case ScenarioError::kNotFinalized:
      return "ScenarioError: no finalized cross-chain purchase";
    case ScenarioError::kOutsideToleranceBand:
      return "ScenarioError: realized amount outside tolerance band";
  }
  return "ScenarioError: unknown error";
}

namespace xm::sim {
  using ledger::CrosschainPurchaseFinalized;
  using market::ListingStatus;

  namespace {
    constexpr uint64_t kCollectionId{0x100};
    constexpr uint64_t kSellerId{0x200};
    constexpr uint64_t kBuyerId{0x201};

    /// Seller holds a fresh asset of an approved collection
    outcome::result<Participants> prepareListing(ChainNode &home) {
      Participants participants{chainAddress(home.chain_id, kCollectionId),
                                1,
                                chainAddress(home.chain_id, kSellerId),
                                {}};
      home.nft->mint(
          participants.collection, participants.seller, participants.asset_id);
      OUTCOME_TRY(home.nft->setApprovalForAll(
          participants.collection, participants.seller, home.market, true));
      OUTCOME_TRY(home.call(
          home.owner, 0, [&](Marketplace &marketplace, Runtime &runtime) {
            return marketplace.addApprovedContract(runtime,
                                                   participants.collection);
          }));
      return std::move(participants);
    }

    outcome::result<void> checkDelivered(ChainNode &home,
                                         const Participants &participants) {
      OUTCOME_TRY(holder,
                  home.nft->ownerOf(participants.collection,
                                    participants.asset_id));
      if (holder != participants.buyer) {
        return ScenarioError::kAssetNotDelivered;
      }
      OUTCOME_TRY(listing,
                  home.marketplace->getListing(participants.collection,
                                               participants.asset_id));
      if (listing.isActive()) {
        return ScenarioError::kListingStillActive;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<Participants> runLocalPurchase(World &world,
                                                 const TokenAmount &price) {
    auto &home{*world.home};
    OUTCOME_TRY(participants, prepareListing(home));
    participants.buyer = chainAddress(home.chain_id, kBuyerId);
    home.ledger->mintNative(participants.buyer, price);

    OUTCOME_TRY(home.call(
        participants.seller,
        0,
        [&](Marketplace &marketplace, Runtime &runtime) {
          return marketplace.list(runtime,
                                  participants.collection,
                                  participants.asset_id,
                                  price,
                                  false);
        }));
    OUTCOME_TRY(home.call(
        participants.buyer,
        price,
        [&](Marketplace &marketplace, Runtime &runtime) {
          return marketplace.buyLocal(runtime,
                                      participants.collection,
                                      participants.asset_id,
                                      participants.buyer);
        }));
    OUTCOME_TRY(checkDelivered(home, participants));
    return std::move(participants);
  }

  outcome::result<Participants> runCrosschainPurchase(
      World &world, const TokenAmount &price, BasisPoints slippage_bps) {
    auto &home{*world.home};
    auto &remote{*world.remote};
    OUTCOME_TRY(participants, prepareListing(home));
    participants.buyer = chainAddress(remote.chain_id, kBuyerId);

    OUTCOME_TRY(home.call(
        participants.seller,
        0,
        [&](Marketplace &marketplace, Runtime &runtime) {
          return marketplace.list(runtime,
                                  participants.collection,
                                  participants.asset_id,
                                  price,
                                  true);
        }));

    OUTCOME_TRY(fee,
                remote.marketplace->quoteRelayFee(home.chain_id,
                                                  participants.collection,
                                                  participants.asset_id,
                                                  participants.buyer,
                                                  {}));
    OUTCOME_TRY(expected_stable,
                remote.router->quoteExactInput(
                    remote.wrapped_token,
                    remote.stable_token,
                    remote.marketplace->config().poolFee(),
                    price));
    const TokenAmount min_stable_out{
        expected_stable
        - expected_stable * slippage_bps / primitives::kBasisPointsDenominator};
    remote.ledger->mintNative(participants.buyer, price + fee.native_fee);
    OUTCOME_TRY(remote.call(participants.buyer,
                            price + fee.native_fee,
                            [&](Marketplace &marketplace, Runtime &runtime) {
                              return marketplace.buyCrosschain(
                                  runtime,
                                  home.chain_id,
                                  participants.collection,
                                  participants.asset_id,
                                  participants.buyer,
                                  price,
                                  min_stable_out,
                                  {});
                            }));

    world.network->flush();
    if (world.network->deliverAll() != 0) {
      return ScenarioError::kNotFinalized;
    }
    OUTCOME_TRY(checkDelivered(home, participants));

    const auto band{market::toleranceBand(
        price, home.marketplace->config().conversionPolicy())};
    for (const auto &entry : home.ledger->events()) {
      if (const auto *finalized{
              boost::get<CrosschainPurchaseFinalized>(&entry.event)}) {
        if (!band.in(finalized->realized_amount)) {
          return ScenarioError::kOutsideToleranceBand;
        }
        return std::move(participants);
      }
    }
    return ScenarioError::kNotFinalized;
  }

  void printBalances(const World &world,
                     const Participants &participants,
                     std::ostream &os) {
    TableWriter table{{"chain", 'r'},
                      "account",
                      {"native", 'r'},
                      {"wrapped", 'r'},
                      {"stable", 'r'}};
    for (const auto &node : {world.home, world.remote}) {
      const std::vector<std::pair<std::string, Address>> accounts{
          {"seller", participants.seller},
          {"buyer", participants.buyer},
          {"marketplace", node->market}};
      for (const auto &account : accounts) {
        auto row{table.row()};
        row["chain"] = std::to_string(node->chain_id);
        row["account"] = account.first;
        row["native"] = node->ledger->balance(account.second).str();
        row["wrapped"] =
            node->tokens->balanceOf(node->wrapped_token, account.second).str();
        row["stable"] =
            node->tokens->balanceOf(node->stable_token, account.second).str();
      }
    }
    table.write(os);
  }

  void printEvents(const World &world, std::ostream &os) {
    for (const auto &node : {world.home, world.remote}) {
      for (const auto &entry : node->ledger->events()) {
        os << "[" << node->chain_id << "] " << ledger::describe(entry.event)
           << "\n";
      }
    }
  }

}  // namespace xm::sim
