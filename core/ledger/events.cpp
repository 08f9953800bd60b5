/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/events.hpp"

#include <sstream>

namespace xm::ledger {

  namespace {
    struct Describe : boost::static_visitor<std::string> {
      std::string operator()(const Listed &e) const {
        std::stringstream s;
        s << "Listed " << toString(e.asset_contract) << " #" << e.asset_id
          << " by " << toString(e.seller) << " at " << e.price
          << (e.status == ListedStatus::kCrosschain ? " cross-chain"
                                                    : " local");
        return s.str();
      }

      std::string operator()(const PriceEdited &e) const {
        return "PriceEdited " + e.key.toHex() + " to " + e.price.str();
      }

      std::string operator()(const Delisted &e) const {
        return "Delisted " + e.key.toHex();
      }

      std::string operator()(const LocalPurchase &e) const {
        std::stringstream s;
        s << "LocalPurchase " << e.key.toHex() << " by " << toString(e.buyer)
          << " for " << e.price << " fee " << e.fee;
        return s.str();
      }

      std::string operator()(const CrosschainPurchaseSent &e) const {
        std::stringstream s;
        s << "CrosschainPurchaseSent to chain " << e.dst_chain_id << " nonce "
          << e.nonce << " guid " << e.guid.toHex() << " stable "
          << e.stable_amount << " relay fee " << e.relay_fee;
        return s.str();
      }

      std::string operator()(const CrosschainPurchaseFinalized &e) const {
        std::stringstream s;
        s << "CrosschainPurchaseFinalized " << e.key.toHex() << " from chain "
          << e.src_chain_id << " nonce " << e.nonce << " realized "
          << e.realized_amount << " fee " << e.fee;
        return s.str();
      }

      std::string operator()(const FinalizationFailed &e) const {
        std::stringstream s;
        s << "FinalizationFailed from chain " << e.src_chain_id << " nonce "
          << e.nonce << " holding " << e.amount << " of "
          << toString(e.token) << ": " << e.reason;
        return s.str();
      }

      std::string operator()(const FeesWithdrawn &e) const {
        std::stringstream s;
        s << "FeesWithdrawn to " << toString(e.to) << " native "
          << e.native_amount << " wrapped " << e.wrapped_amount;
        return s.str();
      }
    };
  }  // namespace

  std::string describe(const Event &event) {
    return boost::apply_visitor(Describe{}, event);
  }

}  // namespace xm::ledger
