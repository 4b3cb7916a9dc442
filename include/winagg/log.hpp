#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace winagg::log {
constexpr inline char const logger_name[] = "winagg";
constexpr inline char const log_pattern[] = "%^[%H:%M:%S.%f] [%n] [%L] %v%$";

/**
 * @brief Library logger
 *
 * Created on first use with a colored stdout sink at level warn. If the application already registered a logger
 * named "winagg" with spdlog, that logger is used instead.
 */
inline std::shared_ptr<spdlog::logger> const &get() {
  static std::shared_ptr<spdlog::logger> const logger = [] {
    if (auto existing = spdlog::get(logger_name)) {
      return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    created->set_pattern(log_pattern);
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);
    return created;
  }();
  return logger;
}

inline void set_level(spdlog::level::level_enum level) { get()->set_level(level); }
} // namespace winagg::log
