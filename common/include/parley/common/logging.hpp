#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace parley {

  inline constexpr const char* LOGGER_NAME = "parley";

  // Shared library logger (stderr). Created on first use; the initial level is read from
  // PARLEY_LOG_LEVEL and defaults to "warn".
  [[nodiscard]] std::shared_ptr<spdlog::logger> logger();

  // Accepts spdlog level names: trace, debug, info, warn, err, critical, off.
  void set_log_level(std::string_view level);

}  // namespace parley
