/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace xm::codec::payload {
  enum class PayloadEncodeError { kNegativeInteger = 1, kIntOverflow };

  enum class PayloadDecodeError {
    kWrongSize = 1,
    kDirtyAddressPadding,
  };
}  // namespace xm::codec::payload

OUTCOME_HPP_DECLARE_ERROR(xm::codec::payload, PayloadEncodeError);
OUTCOME_HPP_DECLARE_ERROR(xm::codec::payload, PayloadDecodeError);
