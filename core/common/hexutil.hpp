/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace xm::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    kNotEnoughInput = 1,
    kNon0xPrefix,
    kNonHexInput,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes - input bytes
   * @return hex string without prefix
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex - even-length string of hex digits, no prefix
   * @return decoded bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with mandatory 0x prefix
   * @param hex - "0x"-prefixed hex string
   * @return decoded bytes or UnhexError
   */
  outcome::result<Bytes> unhexWith0x(std::string_view hex);

}  // namespace xm::common

OUTCOME_HPP_DECLARE_ERROR(xm::common, UnhexError);
