#include "common/logging/logger.h"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace otalink::logging {

namespace {
constexpr const char* kLoggerName = "otalink";
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_logger() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto created = std::make_shared<spdlog::logger>(kLoggerName, sink);
  created->set_pattern(kPattern);
  created->set_level(spdlog::level::info);
  return created;
}
}  // namespace

void configure_logging(LogLevel level, bool console, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& e) {
      // Fall back to the console so the failure itself is visible.
      if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      }
      auto fallback = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
      fallback->error("Failed to open log file {}: {}", log_file, e.what());
    }
  }

  auto configured = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  configured->set_pattern(kPattern);
  configured->set_level(to_spdlog(level));
  configured->flush_on(spdlog::level::warn);

  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = std::move(configured);
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (!g_logger) {
    g_logger = make_console_logger();
  }
  return g_logger;
}

}  // namespace otalink::logging
