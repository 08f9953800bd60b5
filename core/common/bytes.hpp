/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <vector>

#include "common/cmp.hpp"

namespace xm {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace xm

namespace gsl {
  inline bool operator==(const xm::Bytes &l, const xm::BytesIn &r) {
    return xm::BytesIn{l} == r;
  }
  inline bool operator==(const xm::BytesIn &l, const xm::Bytes &r) {
    return l == xm::BytesIn{r};
  }
  XM_OPERATOR_NOT_EQUAL_2(xm::Bytes, xm::BytesIn)
  XM_OPERATOR_NOT_EQUAL_2(xm::BytesIn, xm::Bytes)
}  // namespace gsl
