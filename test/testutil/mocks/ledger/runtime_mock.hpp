/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "ledger/runtime.hpp"

namespace xm::ledger {

  class MockRuntime : public Runtime {
   public:
    MOCK_CONST_METHOD0(getChainId, ChainId());

    MOCK_CONST_METHOD0(getImmediateCaller, Address());

    MOCK_CONST_METHOD0(getCurrentReceiver, Address());

    MOCK_CONST_METHOD0(getValueReceived, TokenAmount());

    MOCK_CONST_METHOD0(getCurrentTime, Timestamp());

    MOCK_CONST_METHOD1(getBalance,
                       outcome::result<TokenAmount>(const Address &address));

    MOCK_METHOD2(sendFunds,
                 outcome::result<void>(const Address &to,
                                       const TokenAmount &amount));

    MOCK_METHOD1(emitEvent, void(Event event));
  };

}  // namespace xm::ledger
