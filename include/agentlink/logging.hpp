#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace agentlink {

constexpr const char *kLoggerName = "agentlink";

namespace detail {

inline spdlog::level::level_enum resolve_log_level() {
  if (const char *level = std::getenv("AGENTLINK_LOG_LEVEL")) {
    return spdlog::level::from_str(level);
  }
  return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> make_logger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(resolve_log_level());
  if (const char *pattern = std::getenv("AGENTLINK_LOG_PATTERN")) {
    created->set_pattern(pattern);
  }
  return created;
}

} // namespace detail

/// Library-wide logger, created on first use.
/// Level comes from AGENTLINK_LOG_LEVEL, pattern from AGENTLINK_LOG_PATTERN.
inline spdlog::logger &log() {
  static std::shared_ptr<spdlog::logger> instance = detail::make_logger();
  return *instance;
}

} // namespace agentlink
