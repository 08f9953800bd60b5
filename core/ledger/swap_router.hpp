/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xm::ledger {
  using primitives::Timestamp;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Pool fee tier in hundredths of a basis point
  using PoolFee = uint32_t;

  struct ExactInputSingleParams {
    Address token_in;
    Address token_out;
    PoolFee fee{};
    Address recipient;
    /** Swap is rejected after this time */
    Timestamp deadline{};
    TokenAmount amount_in;
    /** Slippage floor, the swap fails if output is below */
    TokenAmount amount_out_minimum;
  };

  /**
   * Currency-exchange venue executing swaps at spot price
   */
  class SwapRouter {
   public:
    virtual ~SwapRouter() = default;

    /// Router address, spender of the input token
    virtual Address address() const = 0;

    /**
     * Exact-input single-hop swap. Pulls amount_in of token_in from caller
     * using caller's allowance to the router and sends the output to
     * recipient.
     * @param caller - account paying the input
     * @param params - swap parameters
     * @return realized output amount
     */
    virtual outcome::result<TokenAmount> exactInputSingle(
        const Address &caller, const ExactInputSingleParams &params) = 0;
  };
}  // namespace xm::ledger
