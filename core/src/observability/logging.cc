#include "emitcore/observability/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace emitcore::observability {

static constexpr const char* kLoggerName = "emitcore";

static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Trace:
      return spdlog::level::trace;
    case LogLevel::Debug:
      return spdlog::level::debug;
    case LogLevel::Info:
      return spdlog::level::info;
    case LogLevel::Warn:
      return spdlog::level::warn;
    case LogLevel::Error:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

std::string_view ToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Trace:
      return "trace";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
  }
  return "info";
}

static std::shared_ptr<spdlog::logger> InstallStderrLogger(LogLevel level) {
  // Diagnostics go to stderr so they never mix with host stdout
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);

  // Timestamp + level + message
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  logger->set_level(ToSpdlogLevel(level));

  spdlog::set_default_logger(logger);

  // Never throw from logging
  spdlog::set_error_handler([](const std::string&) {});
  return logger;
}

void InitLocalLogging(LogLevel level) {
  InstallStderrLogger(level);
}

void Log(LogLevel level, const std::string& message, const char* file, int line) noexcept {
  try {
    auto logger = spdlog::default_logger();

    // spdlog's unnamed built-in logger writes to stdout; a host that
    // never initialized logging gets the stderr logger instead
    if (!logger || logger->name().empty()) {
      logger = InstallStderrLogger(LogLevel::Info);
    }

    logger->log(spdlog::source_loc{file, line, ""}, ToSpdlogLevel(level), message);
  } catch (const std::exception&) {
    // spdlog reports through its error handler; nothing left to report to
  }
}

}  // namespace emitcore::observability
