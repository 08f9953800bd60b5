/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace xm::primitives {
  /// Amount of native or fungible token in the smallest unit
  using TokenAmount = BigInt;

  /// Identifier of an asset inside its collection, uint256 on the wire
  using TokenId = BigInt;

  /// Relay-level identifier of a ledger
  using ChainId = uint32_t;

  using Nonce = uint64_t;

  /// Seconds since epoch as seen by the ledger
  using Timestamp = uint64_t;

  using BasisPoints = uint64_t;

  /// Basis point denominator shared by fee and conversion policies
  constexpr BasisPoints kBasisPointsDenominator{10000};

  /// 10^18, one whole native unit
  inline const TokenAmount kOneNative{"1000000000000000000"};
}  // namespace xm::primitives
