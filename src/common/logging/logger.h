#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace otalink::logging {

enum class LogLevel { trace, debug, info, warn, error, critical, off };

// Configure the process-wide logger. Safe to call more than once; the last
// call wins. When log_file is non-empty a file sink is added next to the
// console sink (or replaces it when console is false).
void configure_logging(LogLevel level, bool console, const std::string& log_file = "");

// Returns the shared logger, creating a default console logger on first use.
std::shared_ptr<spdlog::logger> logger();

}  // namespace otalink::logging

// SPDLOG_LOGGER_* honour SPDLOG_ACTIVE_LEVEL, so trace/debug calls compile
// out when the build raises the active level.
#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::otalink::logging::logger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::otalink::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::otalink::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::otalink::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::otalink::logging::logger(), __VA_ARGS__)
