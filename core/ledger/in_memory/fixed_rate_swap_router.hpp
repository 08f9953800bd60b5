/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "ledger/in_memory/in_memory_tokens.hpp"
#include "ledger/swap_router.hpp"

namespace xm::ledger::in_memory {

  /// Pool fee tiers are expressed in millionths
  constexpr PoolFee kPoolFeeDenominator{1000000};

  /**
   * Swap venue quoting every pair at a fixed rate. Output is paid from the
   * router's own balance of the output token.
   */
  class FixedRateSwapRouter : public SwapRouter {
   public:
    /// amount_out = amount_in * numerator / denominator before pool fee
    struct Rate {
      TokenAmount numerator;
      TokenAmount denominator;
    };

    FixedRateSwapRouter(std::shared_ptr<InMemoryLedger> ledger,
                        std::shared_ptr<InMemoryTokens> tokens,
                        Address address);

    Address address() const override;

    outcome::result<TokenAmount> exactInputSingle(
        const Address &caller, const ExactInputSingleParams &params) override;

    void setRate(const Address &token_in,
                 const Address &token_out,
                 Rate rate);

    /// Output a swap would produce, without executing it
    outcome::result<TokenAmount> quoteExactInput(
        const Address &token_in,
        const Address &token_out,
        PoolFee fee,
        const TokenAmount &amount_in) const;

   private:
    std::shared_ptr<InMemoryLedger> ledger_;
    std::shared_ptr<InMemoryTokens> tokens_;
    Address address_;
    std::map<std::pair<Address, Address>, Rate> rates_;
    common::Logger logger_;
  };

}  // namespace xm::ledger::in_memory
