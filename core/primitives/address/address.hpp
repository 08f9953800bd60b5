/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace xm::primitives::address {

  /// Length of a ledger account address
  constexpr size_t kAddressLength{20};

  /**
   * @brief Address refers to an account or a contract on one ledger
   */
  struct Address : public common::Blob<kAddressLength> {
    using Blob::Blob;

    Address() = default;

    explicit Address(const Blob<kAddressLength> &blob) : Blob{blob} {}

    /// Zero address, used as "no address" in zeroed records
    bool isZero() const;

    /**
     * Address as relay address-bytes, left padded to 32 bytes
     */
    Bytes toPeerBytes() const;

    /// Parse 0x-prefixed or plain hex
    static outcome::result<Address> fromHex(std::string_view hex);

    /**
     * Parse relay address-bytes, either raw 20 bytes or 32 bytes with 12
     * leading zeroes
     */
    static outcome::result<Address> fromPeerBytes(BytesIn bytes);

    /// Deterministic address for tests and simulations
    static Address makeFromId(uint64_t id);
  };

  std::string toString(const Address &address);

}  // namespace xm::primitives::address

namespace std {
  template <>
  struct hash<xm::primitives::address::Address> {
    size_t operator()(const xm::primitives::address::Address &x) const {
      using xm::primitives::address::kAddressLength;
      return std::hash<xm::common::Blob<kAddressLength>>()(x);
    }
  };
}  // namespace std
