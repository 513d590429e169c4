#include <mosdl/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace mosdl {

  namespace {

    constexpr const char* logger_name = "mosdl";

    std::shared_ptr<spdlog::logger>
    create_logger() {
      auto log = spdlog::stderr_color_mt(logger_name);
      log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      log->set_level(spdlog::level::info);

      if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
        std::string level_str(env_level);
        std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        auto level = spdlog::level::from_str(level_str);
        // from_str maps unknown names to off; keep the default then
        if (level != spdlog::level::off || level_str == "off")
          log->set_level(level);
      }
      return log;
    }

  } // namespace

  std::shared_ptr<spdlog::logger>
  logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
  }

  void
  set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
  }

} // namespace mosdl
