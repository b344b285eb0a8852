#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opentelemetry/sdk/logs/exporter.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>
#include <opentelemetry/sdk/trace/exporter.h>
#include <opentelemetry/sdk/trace/span_data.h>

#include "emitcore/v1/records.pb.h"

namespace emitcore::exporters {

// ------------------------------------------------------------
// JsonLinesFile
// ------------------------------------------------------------
// Append-only newline-delimited JSON file. Each Append() writes
// one batch and flushes it.
//
class JsonLinesFile {
 public:
  // Opens `path` in append mode; throws std::runtime_error on failure.
  explicit JsonLinesFile(std::string path);

  JsonLinesFile(const JsonLinesFile&) = delete;
  JsonLinesFile& operator=(const JsonLinesFile&) = delete;

  // Write every line followed by '\n'. Returns false on I/O error.
  bool Append(const std::vector<std::string>& lines) noexcept;

  // Further Append() calls return false.
  void Close() noexcept;

  bool is_open() noexcept;

  const std::string& path() const {
    return path_;
  }

 private:
  std::mutex mu_;
  std::string path_;
  std::ofstream out_;
};

// Render one record as a single line of JSON. Returns false when
// the message cannot be printed.
bool ToJsonLine(const google::protobuf::Message& record, std::string* line);

// Record conversions (exposed for tests).
emitcore::v1::SpanRecord ToSpanRecord(const opentelemetry::sdk::trace::SpanData& span);
emitcore::v1::MetricRecord ToMetricRecord(const opentelemetry::sdk::metrics::ResourceMetrics& data);

// ------------------------------------------------------------
// FileSpanExporter
// ------------------------------------------------------------
class FileSpanExporter final : public opentelemetry::sdk::trace::SpanExporter {
 public:
  explicit FileSpanExporter(std::shared_ptr<JsonLinesFile> file);

  std::unique_ptr<opentelemetry::sdk::trace::Recordable> MakeRecordable() noexcept override;

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::trace::Recordable>>&
          spans) noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;
  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  std::shared_ptr<JsonLinesFile> file_;
  std::atomic<bool> is_shutdown_{false};
};

// ------------------------------------------------------------
// FileLogRecordExporter
// ------------------------------------------------------------
class FileLogRecordExporter final : public opentelemetry::sdk::logs::LogRecordExporter {
 public:
  explicit FileLogRecordExporter(std::shared_ptr<JsonLinesFile> file);

  std::unique_ptr<opentelemetry::sdk::logs::Recordable> MakeRecordable() noexcept override;

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::logs::Recordable>>&
          records) noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;
  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  std::shared_ptr<JsonLinesFile> file_;
  std::atomic<bool> is_shutdown_{false};
};

// ------------------------------------------------------------
// FileMetricExporter
// ------------------------------------------------------------
// One line per collection cycle, cumulative temporality.
//
class FileMetricExporter final : public opentelemetry::sdk::metrics::PushMetricExporter {
 public:
  explicit FileMetricExporter(std::shared_ptr<JsonLinesFile> file);

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::sdk::metrics::ResourceMetrics& data) noexcept override;

  opentelemetry::sdk::metrics::AggregationTemporality GetAggregationTemporality(
      opentelemetry::sdk::metrics::InstrumentType instrument_type) const noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;
  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  std::shared_ptr<JsonLinesFile> file_;
  std::atomic<bool> is_shutdown_{false};
};

}  // namespace emitcore::exporters
