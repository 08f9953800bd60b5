/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/in_memory/fixed_rate_swap_router.hpp"

#include "ledger/in_memory/ledger_error.hpp"

namespace xm::ledger::in_memory {

  FixedRateSwapRouter::FixedRateSwapRouter(
      std::shared_ptr<InMemoryLedger> ledger,
      std::shared_ptr<InMemoryTokens> tokens,
      Address address)
      : ledger_{std::move(ledger)},
        tokens_{std::move(tokens)},
        address_{address},
        logger_{common::createLogger("SwapRouter")} {}

  Address FixedRateSwapRouter::address() const {
    return address_;
  }

  void FixedRateSwapRouter::setRate(const Address &token_in,
                                    const Address &token_out,
                                    Rate rate) {
    rates_[std::make_pair(token_in, token_out)] = std::move(rate);
  }

  outcome::result<TokenAmount> FixedRateSwapRouter::quoteExactInput(
      const Address &token_in,
      const Address &token_out,
      PoolFee fee,
      const TokenAmount &amount_in) const {
    if (amount_in < 0) {
      return LedgerError::kNegativeAmount;
    }
    auto it{rates_.find(std::make_pair(token_in, token_out))};
    if (it == rates_.end()) {
      return LedgerError::kUnknownPair;
    }
    const auto &rate{it->second};
    TokenAmount gross{amount_in * rate.numerator / rate.denominator};
    return TokenAmount{gross - gross * fee / kPoolFeeDenominator};
  }

  outcome::result<TokenAmount> FixedRateSwapRouter::exactInputSingle(
      const Address &caller, const ExactInputSingleParams &params) {
    if (ledger_->now() > params.deadline) {
      return LedgerError::kSwapExpired;
    }
    OUTCOME_TRY(amount_out,
                quoteExactInput(params.token_in,
                                params.token_out,
                                params.fee,
                                params.amount_in));
    if (amount_out < params.amount_out_minimum) {
      logger_->debug("swap output {} below minimum {}",
                     amount_out.str(),
                     params.amount_out_minimum.str());
      return LedgerError::kTooLittleReceived;
    }
    if (tokens_->balanceOf(params.token_out, address_) < amount_out) {
      return LedgerError::kInsufficientLiquidity;
    }
    OUTCOME_TRY(tokens_->transferFrom(
        params.token_in, address_, caller, address_, params.amount_in));
    OUTCOME_TRY(tokens_->transfer(
        params.token_out, address_, params.recipient, amount_out));
    return amount_out;
  }

}  // namespace xm::ledger::in_memory
