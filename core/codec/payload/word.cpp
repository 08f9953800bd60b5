/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/payload/word.hpp"

#include <algorithm>

namespace xm::codec::payload {
  using primitives::address::kAddressLength;

  outcome::result<void> encodeUint256(const BigInt &value, Bytes &out) {
    if (value < 0) {
      return PayloadEncodeError::kNegativeInteger;
    }
    Bytes bytes;
    if (value != 0) {
      export_bits(value, std::back_inserter(bytes), 8);
    }
    if (bytes.size() > kWordSize) {
      return PayloadEncodeError::kIntOverflow;
    }
    out.insert(out.end(), kWordSize - bytes.size(), 0);
    append(out, bytes);
    return outcome::success();
  }

  void encodeAddress(const Address &address, Bytes &out) {
    out.insert(out.end(), kWordSize - kAddressLength, 0);
    append(out, address);
  }

  outcome::result<BigInt> decodeUint256(BytesIn word) {
    if (word.size() != kWordSize) {
      return PayloadDecodeError::kWrongSize;
    }
    BigInt value;
    import_bits(value, word.begin(), word.end(), 8);
    return value;
  }

  outcome::result<Address> decodeAddress(BytesIn word) {
    if (word.size() != kWordSize) {
      return PayloadDecodeError::kWrongSize;
    }
    const auto padding{word.first(kWordSize - kAddressLength)};
    if (!std::all_of(
            padding.begin(), padding.end(), [](auto b) { return b == 0; })) {
      return PayloadDecodeError::kDirtyAddressPadding;
    }
    Address address;
    const auto tail{word.last(kAddressLength)};
    std::copy(tail.begin(), tail.end(), address.begin());
    return address;
  }
}  // namespace xm::codec::payload
