/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <algorithm>

namespace xm::primitives::address {
  using common::BlobError;

  constexpr size_t kPeerBytesLength{32};

  bool Address::isZero() const {
    return std::all_of(begin(), end(), [](auto b) { return b == 0; });
  }

  Bytes Address::toPeerBytes() const {
    Bytes bytes(kPeerBytesLength - kAddressLength, 0);
    append(bytes, *this);
    return bytes;
  }

  outcome::result<Address> Address::fromHex(std::string_view hex) {
    OUTCOME_TRY(blob, Blob::fromHex(hex));
    return Address{blob};
  }

  outcome::result<Address> Address::fromPeerBytes(BytesIn bytes) {
    if (bytes.size() == kPeerBytesLength) {
      const auto padding{bytes.first(kPeerBytesLength - kAddressLength)};
      if (!std::all_of(
              padding.begin(), padding.end(), [](auto b) { return b == 0; })) {
        return BlobError::kIncorrectLength;
      }
      bytes = bytes.last(kAddressLength);
    }
    OUTCOME_TRY(blob, Blob::fromSpan(bytes));
    return Address{blob};
  }

  Address Address::makeFromId(uint64_t id) {
    Address address;
    for (size_t i = 0; i < sizeof(id); ++i) {
      address[kAddressLength - 1 - i] = static_cast<uint8_t>(id >> (8 * i));
    }
    return address;
  }

  std::string toString(const Address &address) {
    return "0x" + address.toHex();
  }

}  // namespace xm::primitives::address
