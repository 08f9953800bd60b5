/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/logger.hpp"
#include "sim/world.hpp"

namespace xm::sim {

  struct Config {
    spdlog::level::level_enum log_level;
    /** (a) local purchase or (b) cross-chain purchase */
    char scenario{'a'};
    ChainId home_chain_id{101};
    ChainId remote_chain_id{102};
    /** Listing price in native units */
    TokenAmount price;
    /** Buyer's accepted slippage of the outbound swap */
    BasisPoints slippage_bps{100};
    WorldParams world;

    static Config read(int argc, char *argv[]);
  };

}  // namespace xm::sim
