#include <gtest/gtest.h>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#include "emitcore/observability/logging.h"

namespace emitcore::observability {
namespace {

// Restores whatever default logger was installed before the test.
class DefaultLoggerGuard {
 public:
  DefaultLoggerGuard() : previous_(spdlog::default_logger()) {}
  ~DefaultLoggerGuard() {
    spdlog::set_default_logger(previous_);
  }

 private:
  std::shared_ptr<spdlog::logger> previous_;
};

bool WritesToStderr(const spdlog::logger& logger) {
  const auto& sinks = logger.sinks();
  return sinks.size() == 1 &&
         std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sinks[0]) != nullptr;
}

}  // namespace

TEST(LoggingTest, UninitializedLoggingFallsBackToStderr) {
  DefaultLoggerGuard guard;

  // Same shape as spdlog's built-in default: unnamed
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("", sink));

  EC_LOG_INFO_FMT("exporter {} ready", "console");

  auto logger = spdlog::default_logger();
  EXPECT_EQ(logger->name(), "emitcore");
  EXPECT_TRUE(WritesToStderr(*logger));
  EXPECT_EQ(logger->level(), spdlog::level::info);
  EXPECT_TRUE(sink->last_formatted().empty());
}

TEST(LoggingTest, InitLocalLoggingInstallsStderrLoggerAtLevel) {
  DefaultLoggerGuard guard;

  InitLocalLogging(LogLevel::Warn);

  auto logger = spdlog::default_logger();
  EXPECT_EQ(logger->name(), "emitcore");
  EXPECT_TRUE(WritesToStderr(*logger));
  EXPECT_EQ(logger->level(), spdlog::level::warn);
}

TEST(LoggingTest, NamedHostLoggerIsKept) {
  DefaultLoggerGuard guard;

  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
  auto host = std::make_shared<spdlog::logger>("host", sink);
  host->set_pattern("%l %v");
  spdlog::set_default_logger(host);

  EC_LOG_WARN_FMT("queue at {}%", 90);

  EXPECT_EQ(spdlog::default_logger(), host);
  auto lines = sink->last_formatted();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].rfind("warning queue at 90%", 0), 0u);
}

TEST(LogLevelTest, Names) {
  EXPECT_EQ(ToString(LogLevel::Trace), "trace");
  EXPECT_EQ(ToString(LogLevel::Error), "error");
}

}  // namespace emitcore::observability
