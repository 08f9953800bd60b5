/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "common/blob.hpp"
#include "testutil/outcome.hpp"

namespace xm::common {

  /**
   * @given bytes
   * @when hex them
   * @then lowercase hex without prefix
   */
  TEST(HexutilTest, HexLower) {
    EXPECT_EQ(hex_lower(Bytes{0x00, 0xAB, 0x1f}), "00ab1f");
    EXPECT_EQ(hex_lower(Bytes{}), "");
  }

  /**
   * @given hex strings of both cases
   * @when unhex
   * @then decoded bytes
   */
  TEST(HexutilTest, Unhex) {
    EXPECT_OUTCOME_EQ(unhex("00ab1F"), (Bytes{0x00, 0xab, 0x1f}));
    EXPECT_OUTCOME_EQ(unhexWith0x("0x0102"), (Bytes{1, 2}));
  }

  /**
   * @given malformed hex
   * @when unhex
   * @then matching UnhexError
   */
  TEST(HexutilTest, UnhexErrors) {
    EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, unhex("abc"));
    EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("zz"));
    EXPECT_OUTCOME_ERROR(UnhexError::kNon0xPrefix, unhexWith0x("0102"));
  }

  /**
   * @given hex of a 32-byte hash
   * @when parse as blob and print back
   * @then same hex, wrong length rejected
   */
  TEST(HexutilTest, Blob) {
    std::string hex(64, 'a');
    EXPECT_OUTCOME_TRUE(hash, Hash256::fromHex(hex));
    EXPECT_EQ(hash.toHex(), hex);
    EXPECT_OUTCOME_ERROR(BlobError::kIncorrectLength,
                         Hash256::fromHex("aabb"));
  }

}  // namespace xm::common
