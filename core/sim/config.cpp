/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sim/config.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace xm::sim {

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      boost::optional<std::string> config_file;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("xmarket simulator options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_file), "read options from file");
    option("scenario,s",
           po::value(&config.scenario)->default_value('a'),
           "scenario, (a) local or (b) cross-chain purchase");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("price",
           po::value(&config.price)->default_value(primitives::kOneNative),
           "listing price in native units");
    option("slippage-bps",
           po::value(&config.slippage_bps)->default_value(100),
           "buyer's accepted outbound swap slippage");
    option("home-chain", po::value(&config.home_chain_id)->default_value(101));
    option("remote-chain",
           po::value(&config.remote_chain_id)->default_value(102));

    po::options_description market_desc("Marketplace options");
    auto market_option{market_desc.add_options()};
    market_option("fee-bps",
                  po::value(&config.world.fee_bps)->default_value(250),
                  "marketplace fee rate");
    auto &policy{config.world.conversion_policy};
    market_option("round-trip-cost-bps",
                  po::value(&policy.round_trip_cost_bps)
                      ->default_value(policy.round_trip_cost_bps),
                  "expected cost of a native -> stable -> native round trip");
    market_option(
        "tolerance-bps",
        po::value(&policy.tolerance_bps)->default_value(policy.tolerance_bps),
        "accepted deviation from the expected inbound amount");
    desc.add(market_desc);

    po::options_description venue_desc("Swap venue and relay options");
    auto venue_option{venue_desc.add_options()};
    venue_option("pool-fee",
                 po::value(&config.world.pool_fee)->default_value(500),
                 "pool fee tier, millionths");
    venue_option(
        "stable-per-native",
        po::value(&config.world.stable_per_native)->default_value(2000),
        "swap rate, whole stable units per whole native unit");
    venue_option("relay-base-fee",
                 po::value(&config.world.relay_fee.base_fee)
                     ->default_value(config.world.relay_fee.base_fee),
                 "relay fee per message");
    venue_option("relay-byte-fee",
                 po::value(&config.world.relay_fee.per_byte_fee)
                     ->default_value(config.world.relay_fee.per_byte_fee),
                 "relay fee per payload byte");
    desc.add(venue_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_file) {
      std::ifstream config_file{*raw.config_file};
      if (!config_file.good()) {
        std::cerr << "cannot read " << *raw.config_file << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = common::parseLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);
    return config;
  }

}  // namespace xm::sim
