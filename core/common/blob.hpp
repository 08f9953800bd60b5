/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

namespace xm::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { kIncorrectLength = 1 };

}  // namespace xm::common

OUTCOME_HPP_DECLARE_ERROR(xm::common, BlobError);

namespace xm::common {

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is usually used to store hashes, addresses etc, but it is not
   * convenient, since the size is not fixed. Blob is fixed size array which
   * compares, hashes and prints like a value.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /// Initialize blob value
    constexpr Blob() : std::array<uint8_t, size_>{} {}

    /// Initialize blob value from array
    explicit constexpr Blob(const std::array<uint8_t, size_> &l)
        : std::array<uint8_t, size_>{l} {}

    static constexpr size_t size() {
      return size_;
    }

    /// Converts current blob to hex string
    std::string toHex() const noexcept {
      return hex_lower(*this);
    }

    /**
     * Create Blob from arbitrary span of bytes
     * @param span - bytes, size must be exactly size_
     * @return blob or kIncorrectLength
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from hex string
     * @param hex hex string, with or without 0x prefix
     * @return result containing Blob object if hex string has proper size and
     * format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      if (hex.substr(0, 2) == "0x") {
        hex.remove_prefix(2);
      }
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }
  };

  using Hash256 = Blob<32>;

}  // namespace xm::common

namespace std {
  template <size_t N>
  struct hash<xm::common::Blob<N>> {
    auto operator()(const xm::common::Blob<N> &blob) const {
      return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
    }
  };
}  // namespace std
