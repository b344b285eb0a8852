#include <gtest/gtest.h>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <opentelemetry/sdk/trace/span_data.h>

#include "emitcore/exporters/diagnostic_span_exporter.h"

namespace emitcore::exporters {
namespace {

namespace sdk_common = opentelemetry::sdk::common;
namespace trace_sdk = opentelemetry::sdk::trace;

struct FakeState {
  std::vector<sdk_common::ExportResult> results;  // consumed front to back
  std::size_t exported_spans = 0;
  int recordables = 0;
  int flushes = 0;
  int shutdowns = 0;
};

class FakeSpanExporter final : public trace_sdk::SpanExporter {
 public:
  explicit FakeSpanExporter(std::shared_ptr<FakeState> state) : state_(std::move(state)) {}

  std::unique_ptr<trace_sdk::Recordable> MakeRecordable() noexcept override {
    ++state_->recordables;
    return std::make_unique<trace_sdk::SpanData>();
  }

  sdk_common::ExportResult Export(
      const opentelemetry::nostd::span<std::unique_ptr<trace_sdk::Recordable>>& spans) noexcept
      override {
    state_->exported_spans += spans.size();
    auto result = state_->results.front();
    state_->results.erase(state_->results.begin());
    return result;
  }

  bool ForceFlush(std::chrono::microseconds) noexcept override {
    ++state_->flushes;
    return true;
  }
  bool Shutdown(std::chrono::microseconds) noexcept override {
    ++state_->shutdowns;
    return false;
  }

 private:
  std::shared_ptr<FakeState> state_;
};

// Captures emitcore diagnostics for the lifetime of the object.
class CapturedLogs {
 public:
  CapturedLogs() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64)) {
    previous_ = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>("capture", sink_);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
  }

  ~CapturedLogs() {
    spdlog::set_default_logger(previous_);
  }

  std::vector<std::string> lines() const {
    return sink_->last_formatted();
  }

  std::size_t Count(const std::string& needle) const {
    auto all = lines();
    return static_cast<std::size_t>(std::count_if(all.begin(), all.end(), [&](const auto& l) {
      return l.find(needle) != std::string::npos;
    }));
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger> previous_;
};

sdk_common::ExportResult ExportBatch(DiagnosticSpanExporter& exporter, std::size_t n) {
  std::vector<std::unique_ptr<trace_sdk::Recordable>> batch;
  for (std::size_t i = 0; i < n; ++i) {
    batch.push_back(exporter.MakeRecordable());
  }
  return exporter.Export(
      opentelemetry::nostd::span<std::unique_ptr<trace_sdk::Recordable>>(batch.data(), batch.size()));
}

}  // namespace

TEST(DiagnosticSpanExporterTest, PassesResultsThrough) {
  auto state = std::make_shared<FakeState>();
  state->results = {sdk_common::ExportResult::kFailure, sdk_common::ExportResult::kSuccess,
                    sdk_common::ExportResult::kSuccess, sdk_common::ExportResult::kFailure};

  DiagnosticSpanExporter exporter(std::make_unique<FakeSpanExporter>(state), "otlp-http");
  CapturedLogs logs;

  EXPECT_EQ(ExportBatch(exporter, 1), sdk_common::ExportResult::kFailure);
  EXPECT_EQ(ExportBatch(exporter, 2), sdk_common::ExportResult::kSuccess);
  EXPECT_EQ(ExportBatch(exporter, 3), sdk_common::ExportResult::kSuccess);
  EXPECT_EQ(ExportBatch(exporter, 4), sdk_common::ExportResult::kFailure);

  EXPECT_EQ(state->exported_spans, 10u);
  EXPECT_EQ(state->recordables, 10);

  // One success line, ever; one warning per failure
  EXPECT_EQ(logs.Count("first span export succeeded (exporter=otlp-http, spans=2)"), 1u);
  EXPECT_EQ(logs.Count("first span export succeeded"), 1u);
  EXPECT_EQ(logs.Count("span export failed (exporter=otlp-http"), 2u);
}

TEST(DiagnosticSpanExporterTest, ForwardsLifecycle) {
  auto state = std::make_shared<FakeState>();
  DiagnosticSpanExporter exporter(std::make_unique<FakeSpanExporter>(state), "console");

  EXPECT_TRUE(exporter.ForceFlush(std::chrono::microseconds(100)));
  EXPECT_FALSE(exporter.Shutdown(std::chrono::microseconds(100)));

  EXPECT_EQ(state->flushes, 1);
  EXPECT_EQ(state->shutdowns, 1);
}

}  // namespace emitcore::exporters
