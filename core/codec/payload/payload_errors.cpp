/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/payload/payload_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xm::codec::payload, PayloadEncodeError, e) {
  using xm::codec::payload::PayloadEncodeError;
  switch (e) {
    case PayloadEncodeError::kNegativeInteger:
      return "Negative integer";
    case PayloadEncodeError::kIntOverflow:
      return "Integer does not fit 256 bits";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(xm::codec::payload, PayloadDecodeError, e) {
  using xm::codec::payload::PayloadDecodeError;
  switch (e) {
    case PayloadDecodeError::kWrongSize:
      return "Wrong size";
    case PayloadDecodeError::kDirtyAddressPadding:
      return "Address word has non-zero padding";
    default:
      return "Unknown error";
  }
}
