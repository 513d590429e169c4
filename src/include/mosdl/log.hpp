#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace mosdl {

  // Process-wide logger writing to stderr. Created on first use at info level;
  // the SPDLOG_LEVEL environment variable overrides the level.
  std::shared_ptr<spdlog::logger>
  logger();

  void
  set_log_level(spdlog::level::level_enum level);

} // namespace mosdl
