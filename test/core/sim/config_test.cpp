/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sim/config.hpp"

#include <gtest/gtest.h>

namespace xm::sim {

  Config readArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "xmarket_sim");
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return Config::read(static_cast<int>(argv.size()), argv.data());
  }

  /**
   * @given no arguments
   * @when read config
   * @then defaults of the local scenario
   */
  TEST(ConfigTest, Defaults) {
    auto config{readArgs({})};
    EXPECT_EQ(config.scenario, 'a');
    EXPECT_EQ(config.home_chain_id, 101);
    EXPECT_EQ(config.remote_chain_id, 102);
    EXPECT_EQ(config.price, primitives::kOneNative);
    EXPECT_EQ(config.slippage_bps, 100);
    EXPECT_EQ(config.world.fee_bps, 250);
    EXPECT_EQ(config.world.conversion_policy.round_trip_cost_bps, 10);
    EXPECT_EQ(config.world.conversion_policy.tolerance_bps, 50);
    EXPECT_EQ(config.world.pool_fee, 500);
    EXPECT_EQ(config.log_level, spdlog::level::info);
  }

  /**
   * @given cross-chain scenario with custom market and venue parameters
   * @when read config
   * @then parameters reach the world
   */
  TEST(ConfigTest, Overrides) {
    auto config{readArgs({"-s",
                      "b",
                      "-l",
                      "d",
                      "--price",
                      "2000000000000000000",
                      "--fee-bps",
                      "100",
                      "--tolerance-bps",
                      "20",
                      "--stable-per-native",
                      "1500",
                      "--relay-byte-fee",
                      "7"})};
    EXPECT_EQ(config.scenario, 'b');
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.price, primitives::TokenAmount{"2000000000000000000"});
    EXPECT_EQ(config.world.fee_bps, 100);
    EXPECT_EQ(config.world.conversion_policy.tolerance_bps, 20);
    EXPECT_EQ(config.world.stable_per_native, 1500);
    EXPECT_EQ(config.world.relay_fee.per_byte_fee, 7);
    EXPECT_EQ(config.world.relay_fee.base_fee,
              primitives::TokenAmount{"100000000000000"});
  }

}  // namespace xm::sim
