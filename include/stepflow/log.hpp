#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stepflow::log {

inline constexpr std::string_view logger_name = "stepflow";

// Shared library logger, registered with spdlog on first use.
inline auto get() -> std::shared_ptr<spdlog::logger> {
  static std::mutex mutex;
  std::scoped_lock  lock(mutex);

  if (auto existing = spdlog::get(std::string{logger_name})) {
    return existing;
  }
  auto logger = spdlog::stdout_color_mt(std::string{logger_name});
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [%t] %v");
  return logger;
}

inline void set_level(spdlog::level::level_enum level) {
  get()->set_level(level);
}

// Accepts spdlog's level names ("trace", "debug", "info", "warning", "error", "critical", "off").
[[nodiscard]] inline auto parse_level(std::string_view name) -> spdlog::level::level_enum {
  return spdlog::level::from_str(std::string{name});
}

}  // namespace stepflow::log
