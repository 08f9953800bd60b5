/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace xm::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Parse one-letter log level as accepted on the command line
   * @param level - one of [e,w,i,d,t]
   * @return spdlog level, info for unknown letters
   */
  spdlog::level::level_enum parseLogLevel(char level);
}  // namespace xm::common
