#pragma once

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

namespace emitcore::observability {

// Severity of diagnostic messages emitted by emitcore itself.
// Also the type of Configuration::log_level.
enum class LogLevel {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
};

std::string_view ToString(LogLevel level) noexcept;

// ------------------------------------------------------------
// Initialize the diagnostic (stderr) logger
//
// - Uses spdlog
// - Always safe to call, including more than once
// - Never throws from logging afterwards
// ------------------------------------------------------------
void InitLocalLogging(LogLevel level);

// Route one message to the diagnostic logger. Never throws.
// Without InitLocalLogging, a stderr logger at info is installed
// on first use.
void Log(LogLevel level, const std::string& message, const char* file, int line) noexcept;

// ------------------------------------------------------------
// Lazy formatting helper
//
// Formatting errors are swallowed: a bad format string must not
// turn a diagnostic into a failure of the telemetry call.
// ------------------------------------------------------------
template <typename... Args>
inline void LogFmt(LogLevel level, const char* file, int line, fmt::format_string<Args...> fmt_str,
                   Args&&... args) noexcept {
  try {
    Log(level, fmt::format(fmt_str, std::forward<Args>(args)...), file, line);
  } catch (const std::exception& ex) {
    Log(LogLevel::Error, std::string("log formatting failed: ") + ex.what(), file, line);
  }
}

}  // namespace emitcore::observability

// ============================================================
// fmt logging macros
// ============================================================

#define EC_LOG_TRACE_FMT(fmt, ...)                                                        \
  ::emitcore::observability::LogFmt(::emitcore::observability::LogLevel::Trace, __FILE__, \
                                    __LINE__, fmt, ##__VA_ARGS__)

#define EC_LOG_DEBUG_FMT(fmt, ...)                                                        \
  ::emitcore::observability::LogFmt(::emitcore::observability::LogLevel::Debug, __FILE__, \
                                    __LINE__, fmt, ##__VA_ARGS__)

#define EC_LOG_INFO_FMT(fmt, ...)                                                                  \
  ::emitcore::observability::LogFmt(::emitcore::observability::LogLevel::Info, __FILE__, __LINE__, \
                                    fmt, ##__VA_ARGS__)

#define EC_LOG_WARN_FMT(fmt, ...)                                                                  \
  ::emitcore::observability::LogFmt(::emitcore::observability::LogLevel::Warn, __FILE__, __LINE__, \
                                    fmt, ##__VA_ARGS__)

#define EC_LOG_ERROR_FMT(fmt, ...)                                                        \
  ::emitcore::observability::LogFmt(::emitcore::observability::LogLevel::Error, __FILE__, \
                                    __LINE__, fmt, ##__VA_ARGS__)
