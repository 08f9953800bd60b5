/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xm::ledger::in_memory {

  /**
   * @brief Errors of the in-memory ledger simulation
   */
  enum class LedgerError {
    kNegativeAmount = 1,
    kInsufficientBalance,
    kInsufficientAllowance,
    kTokenNotFound,
    kWrongTokenOwner,
    kNotAuthorized,
    kSwapExpired,
    kUnknownPair,
    kTooLittleReceived,
    kInsufficientLiquidity,
    kInsufficientRelayFee,
    kUnsupportedBridgeToken,
    kUnknownChain,
    kUnknownReceiver,
    kUnknownMessage,
    kNoPendingMessage,
  };

}  // namespace xm::ledger::in_memory

OUTCOME_HPP_DECLARE_ERROR(xm::ledger::in_memory, LedgerError);
