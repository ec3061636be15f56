#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <parley/common/logging.hpp>
#include <string>

namespace parley {

  namespace {

    std::shared_ptr<spdlog::logger> create_logger() {
      if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
      }

      auto log = spdlog::stderr_color_mt(LOGGER_NAME);
      log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

      const char* env_level = std::getenv("PARLEY_LOG_LEVEL");
      log->set_level(env_level ? spdlog::level::from_str(env_level) : spdlog::level::warn);
      return log;
    }

  }  // namespace

  std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
  }

  void set_log_level(std::string_view level) {
    logger()->set_level(spdlog::level::from_str(std::string(level)));
  }

}  // namespace parley
