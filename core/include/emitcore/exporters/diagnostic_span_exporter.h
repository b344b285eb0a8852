#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <opentelemetry/sdk/trace/exporter.h>

namespace emitcore::exporters {

// ------------------------------------------------------------
// DiagnosticSpanExporter
// ------------------------------------------------------------
// Decorates a span exporter with connectivity diagnostics:
//  - the first successful export logs one info line
//  - every failed export logs a warning
//
// Spans and result codes pass through untouched.
//
class DiagnosticSpanExporter final : public opentelemetry::sdk::trace::SpanExporter {
 public:
  DiagnosticSpanExporter(std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> inner,
                         std::string exporter_kind);

  std::unique_ptr<opentelemetry::sdk::trace::Recordable> MakeRecordable() noexcept override;

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::trace::Recordable>>&
          spans) noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;
  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> inner_;
  std::string exporter_kind_;
  std::atomic<bool> reported_success_{false};
};

}  // namespace emitcore::exporters
