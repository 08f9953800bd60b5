/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace xm::common {
  namespace {
    spdlog::sink_ptr consoleSink() {
      static auto sink{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    auto logger{std::make_shared<spdlog::logger>(tag, consoleSink())};
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }

  spdlog::level::level_enum parseLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }
}  // namespace xm::common
