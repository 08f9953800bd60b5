/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include "sim/scenarios.hpp"

namespace xm::sim {
  outcome::result<Participants> run(World &world, const Config &config) {
    switch (config.scenario) {
      case 'a':
        return runLocalPurchase(world, config.price);
      case 'b':
        return runCrosschainPurchase(world, config.price, config.slippage_bps);
    }
    return ScenarioError::kUnknownScenario;
  }

  void main(const Config &config) {
    auto log{common::createLogger("xmarket_sim")};
    OUTCOME_EXCEPT(world,
                   World::create(config.home_chain_id,
                                 config.remote_chain_id,
                                 config.world));
    auto participants{run(world, config)};
    printEvents(world, std::cout);
    if (!participants) {
      log->error("scenario {} failed: {}",
                 config.scenario,
                 participants.error().message());
      exit(EXIT_FAILURE);
    }
    printBalances(world, participants.value(), std::cout);
    log->info("scenario {} settled", config.scenario);
  }
}  // namespace xm::sim

int main(int argc, char *argv[]) {
  xm::sim::main(xm::sim::Config::read(argc, argv));
}
