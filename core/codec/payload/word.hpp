/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/payload/payload_errors.hpp"
#include "common/bytes.hpp"
#include "primitives/address/address.hpp"
#include "primitives/big_int.hpp"

namespace xm::codec::payload {
  using primitives::BigInt;
  using primitives::address::Address;

  /// Payload is a sequence of 32-byte big-endian words
  constexpr size_t kWordSize{32};

  /**
   * @brief big-endian encodes unsigned 256-bit integer
   * @param value non-negative integer below 2^256
   * @param out output buffer, one word is appended
   */
  outcome::result<void> encodeUint256(const BigInt &value, Bytes &out);

  /// Appends address left padded to one word
  void encodeAddress(const Address &address, Bytes &out);

  /// Decodes one word as unsigned 256-bit integer
  outcome::result<BigInt> decodeUint256(BytesIn word);

  /// Decodes one word as address, padding must be zero
  outcome::result<Address> decodeAddress(BytesIn word);
}  // namespace xm::codec::payload
