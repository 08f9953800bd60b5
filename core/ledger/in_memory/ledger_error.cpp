/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xm::ledger::in_memory, LedgerError, e) {
  using xm::ledger::in_memory::LedgerError;
  switch (e) {
    case LedgerError::kNegativeAmount:
      return "LedgerError: negative amount";
    case LedgerError::kInsufficientBalance:
      return "LedgerError: insufficient balance";
    case LedgerError::kInsufficientAllowance:
      return "LedgerError: insufficient allowance";
    case LedgerError::kTokenNotFound:
      return "LedgerError: token does not exist";
    case LedgerError::kWrongTokenOwner:
      return "LedgerError: transfer from account not holding the token";
    case LedgerError::kNotAuthorized:
      return "LedgerError: operator is not approved";
    case LedgerError::kSwapExpired:
      return "LedgerError: swap deadline passed";
    case LedgerError::kUnknownPair:
      return "LedgerError: no rate for token pair";
    case LedgerError::kTooLittleReceived:
      return "LedgerError: swap output below minimum";
    case LedgerError::kInsufficientLiquidity:
      return "LedgerError: router cannot cover swap output";
    case LedgerError::kInsufficientRelayFee:
      return "LedgerError: relay fee not covered";
    case LedgerError::kUnsupportedBridgeToken:
      return "LedgerError: token cannot be bridged";
    case LedgerError::kUnknownChain:
      return "LedgerError: no endpoint for chain";
    case LedgerError::kUnknownReceiver:
      return "LedgerError: no relay receiver at address";
    case LedgerError::kUnknownMessage:
      return "LedgerError: no failed message with guid";
    case LedgerError::kNoPendingMessage:
      return "LedgerError: no pending message";
  }
  return "LedgerError: unknown error";
}
