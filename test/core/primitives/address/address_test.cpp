/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using xm::Bytes;
using xm::common::BlobError;
using xm::common::UnhexError;
using xm::primitives::address::Address;

/**
 * @given id
 * @when make address from it
 * @then id is written big-endian into the last bytes
 */
TEST(AddressTest, MakeFromId) {
  auto address{Address::makeFromId(0x0102)};
  EXPECT_EQ(toString(address), "0x0000000000000000000000000000000000000102");
  EXPECT_FALSE(address.isZero());
  EXPECT_TRUE(Address{}.isZero());
}

/**
 * @given address
 * @when convert it to relay peer bytes and back
 * @then 32 bytes with 12 leading zeroes, parsed back to the same address
 */
TEST(AddressTest, PeerBytes) {
  auto address{"0x00112233445566778899aabbccddeeff00112233"_address};
  auto peer{address.toPeerBytes()};
  EXPECT_EQ(
      peer,
      "00000000000000000000000000112233445566778899aabbccddeeff00112233"_unhex);
  EXPECT_OUTCOME_EQ(Address::fromPeerBytes(peer), address);
  Bytes raw{address.begin(), address.end()};
  EXPECT_OUTCOME_EQ(Address::fromPeerBytes(raw), address);
}

/**
 * @given 32 peer bytes with non-zero padding, and 21 bytes
 * @when parse them as address
 * @then kIncorrectLength
 */
TEST(AddressTest, BadPeerBytes) {
  auto peer{Address::makeFromId(7).toPeerBytes()};
  peer[0] = 1;
  EXPECT_OUTCOME_ERROR(BlobError::kIncorrectLength,
                       Address::fromPeerBytes(peer));
  EXPECT_OUTCOME_ERROR(BlobError::kIncorrectLength,
                       Address::fromPeerBytes(Bytes(21, 0)));
}

/**
 * @given hex strings with and without 0x prefix, and malformed ones
 * @when parse them
 * @then well formed parse to the same address, malformed fail
 */
TEST(AddressTest, FromHex) {
  EXPECT_OUTCOME_EQ(
      Address::fromHex("0000000000000000000000000000000000000102"),
      Address::makeFromId(0x0102));
  EXPECT_OUTCOME_EQ(
      Address::fromHex("0x0000000000000000000000000000000000000102"),
      Address::makeFromId(0x0102));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput,
                       Address::fromHex("0x00000000000000000000000000000000000001zz"));
  EXPECT_OUTCOME_ERROR(BlobError::kIncorrectLength, Address::fromHex("0x0102"));
}
