/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "sim/config.hpp"

namespace xm::sim {

  enum class ScenarioError {
    kUnknownScenario = 1,
    kAssetNotDelivered,
    kListingStillActive,
    kNotFinalized,
    kOutsideToleranceBand,
  };

  /// Accounts taking part in a scenario
  struct Participants {
    Address collection;
    TokenId asset_id;
    Address seller;
    Address buyer;
  };

  /**
   * Local listing bought with exact native payment on the home ledger
   * @param world - simulated ledgers
   * @param price - listing price
   * @return accounts involved
   */
  outcome::result<Participants> runLocalPurchase(World &world,
                                                 const TokenAmount &price);

  /**
   * Cross-chain listing on the home ledger bought from the remote ledger,
   * message delivered by the relay network
   * @param world - simulated ledgers
   * @param price - listing price
   * @param slippage_bps - buyer's accepted outbound slippage
   * @return accounts involved
   */
  outcome::result<Participants> runCrosschainPurchase(
      World &world, const TokenAmount &price, BasisPoints slippage_bps);

  /// Balances of scenario accounts, one row per ledger and account
  void printBalances(const World &world,
                     const Participants &participants,
                     std::ostream &os);

  void printEvents(const World &world, std::ostream &os);

}  // namespace xm::sim

OUTCOME_HPP_DECLARE_ERROR(xm::sim, ScenarioError);
