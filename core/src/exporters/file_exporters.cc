#include "emitcore/exporters/file_exporters.h"

#include <google/protobuf/util/json_util.h>

#include <iterator>
#include <stdexcept>

#include <opentelemetry/logs/severity.h>
#include <opentelemetry/sdk/logs/recordable.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>

#include "emitcore/observability/logging.h"
#include "proto_values.h"

namespace sdk_common = opentelemetry::sdk::common;
namespace metrics_sdk = opentelemetry::sdk::metrics;
namespace nostd = opentelemetry::nostd;

namespace emitcore::exporters {

// ------------------------------------------------------------
// JsonLinesFile
// ------------------------------------------------------------
JsonLinesFile::JsonLinesFile(std::string path) : path_(std::move(path)) {
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_) {
    throw std::runtime_error("failed to open telemetry file: " + path_);
  }
}

bool JsonLinesFile::Append(const std::vector<std::string>& lines) noexcept {
  try {
    // Whole batch in one write
    std::string batch;
    for (const auto& line : lines) {
      batch += line;
      batch += '\n';
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (!out_.is_open()) {
      return false;
    }
    out_.write(batch.data(), static_cast<std::streamsize>(batch.size()));
    out_.flush();
    return static_cast<bool>(out_);
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("write to {} failed: {}", path_, ex.what());
    return false;
  }
}

bool JsonLinesFile::is_open() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  return out_.is_open();
}

void JsonLinesFile::Close() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  if (out_.is_open()) {
    out_.close();
  }
}

bool ToJsonLine(const google::protobuf::Message& record, std::string* line) {
  google::protobuf::util::JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;
  opts.add_whitespace = false;

  line->clear();
  auto status = google::protobuf::util::MessageToJsonString(record, line, opts);
  if (!status.ok()) {
    EC_LOG_DEBUG_FMT("record → json failed: {}", status.ToString());
    return false;
  }
  return true;
}

// Write `records` as one batch, skipping any that fail to render.
template <typename Record>
static sdk_common::ExportResult WriteRecords(JsonLinesFile& file,
                                             const std::vector<Record>& records) {
  std::vector<std::string> lines;
  lines.reserve(records.size());

  for (const auto& record : records) {
    std::string line;
    if (ToJsonLine(record, &line)) {
      lines.push_back(std::move(line));
    }
  }

  if (!file.Append(lines)) {
    return sdk_common::ExportResult::kFailure;
  }
  return sdk_common::ExportResult::kSuccess;
}

// ------------------------------------------------------------
// Spans
// ------------------------------------------------------------
static const char* SpanKindName(opentelemetry::trace::SpanKind kind) {
  switch (kind) {
    case opentelemetry::trace::SpanKind::kInternal:
      return "internal";
    case opentelemetry::trace::SpanKind::kServer:
      return "server";
    case opentelemetry::trace::SpanKind::kClient:
      return "client";
    case opentelemetry::trace::SpanKind::kProducer:
      return "producer";
    case opentelemetry::trace::SpanKind::kConsumer:
      return "consumer";
  }
  return "internal";
}

static const char* StatusCodeName(opentelemetry::trace::StatusCode code) {
  switch (code) {
    case opentelemetry::trace::StatusCode::kUnset:
      return "unset";
    case opentelemetry::trace::StatusCode::kOk:
      return "ok";
    case opentelemetry::trace::StatusCode::kError:
      return "error";
  }
  return "unset";
}

emitcore::v1::SpanRecord ToSpanRecord(const opentelemetry::sdk::trace::SpanData& span) {
  emitcore::v1::SpanRecord record;

  record.set_name(std::string(span.GetName()));
  record.set_trace_id(detail::Hex(span.GetTraceId()));
  record.set_span_id(detail::Hex(span.GetSpanId()));
  if (span.GetParentSpanId().IsValid()) {
    record.set_parent_span_id(detail::Hex(span.GetParentSpanId()));
  }
  record.set_kind(SpanKindName(span.GetSpanKind()));

  const uint64_t start = detail::UnixNanos(span.GetStartTime());
  record.set_start_time_unix_nano(start);
  record.set_end_time_unix_nano(start + static_cast<uint64_t>(span.GetDuration().count()));

  auto* status = record.mutable_status();
  status->set_code(StatusCodeName(span.GetStatus()));
  status->set_message(std::string(span.GetDescription()));

  detail::FillStruct(span.GetAttributes(), record.mutable_attributes());

  for (const auto& event : span.GetEvents()) {
    auto* out = record.add_events();
    out->set_name(std::string(event.GetName()));
    out->set_time_unix_nano(detail::UnixNanos(event.GetTimestamp()));
    detail::FillStruct(event.GetAttributes(), out->mutable_attributes());
  }

  detail::FillResource(span.GetResource(), record.mutable_resource());
  record.set_scope(detail::ScopeName(span.GetInstrumentationScope()));

  return record;
}

FileSpanExporter::FileSpanExporter(std::shared_ptr<JsonLinesFile> file) : file_(std::move(file)) {}

std::unique_ptr<opentelemetry::sdk::trace::Recordable> FileSpanExporter::MakeRecordable() noexcept {
  return std::make_unique<opentelemetry::sdk::trace::SpanData>();
}

sdk_common::ExportResult FileSpanExporter::Export(
    const nostd::span<std::unique_ptr<opentelemetry::sdk::trace::Recordable>>& spans) noexcept {
  if (is_shutdown_.load()) {
    return sdk_common::ExportResult::kFailure;
  }

  try {
    std::vector<emitcore::v1::SpanRecord> records;
    records.reserve(spans.size());

    for (auto& recordable : spans) {
      auto* span = static_cast<opentelemetry::sdk::trace::SpanData*>(recordable.get());
      if (span) {
        records.push_back(ToSpanRecord(*span));
      }
    }
    return WriteRecords(*file_, records);
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("file span export failed: {}", ex.what());
    return sdk_common::ExportResult::kFailure;
  }
}

bool FileSpanExporter::ForceFlush(std::chrono::microseconds) noexcept {
  return true;
}

bool FileSpanExporter::Shutdown(std::chrono::microseconds) noexcept {
  is_shutdown_ = true;
  file_->Close();
  return true;
}

// ------------------------------------------------------------
// Logs
// ------------------------------------------------------------
namespace {

// Builds the output record directly; every value is copied on
// arrival so nothing points into caller memory.
class FileLogRecordable final : public opentelemetry::sdk::logs::Recordable {
 public:
  void SetTimestamp(opentelemetry::common::SystemTimestamp timestamp) noexcept override {
    record_.set_time_unix_nano(detail::UnixNanos(timestamp));
  }

  void SetObservedTimestamp(opentelemetry::common::SystemTimestamp timestamp) noexcept override {
    record_.set_observed_time_unix_nano(detail::UnixNanos(timestamp));
  }

  void SetSeverity(opentelemetry::logs::Severity severity) noexcept override {
    const auto index = static_cast<std::size_t>(severity);
    record_.set_severity_number(static_cast<int32_t>(index));
    if (index < std::size(opentelemetry::logs::SeverityNumToText)) {
      const auto text = opentelemetry::logs::SeverityNumToText[index];
      record_.set_severity_text(std::string(text.data(), text.size()));
    }
  }

  void SetBody(const opentelemetry::common::AttributeValue& message) noexcept override {
    detail::SetValue(message, record_.mutable_body());
  }

  // Event ids are not part of the file format. Declared without
  // `override` since older SDKs lack the virtual.
  void SetEventId(int64_t, nostd::string_view) noexcept {}

  void SetTraceId(const opentelemetry::trace::TraceId& trace_id) noexcept override {
    if (trace_id.IsValid()) {
      record_.set_trace_id(detail::Hex(trace_id));
    }
  }

  void SetSpanId(const opentelemetry::trace::SpanId& span_id) noexcept override {
    if (span_id.IsValid()) {
      record_.set_span_id(detail::Hex(span_id));
    }
  }

  void SetTraceFlags(const opentelemetry::trace::TraceFlags&) noexcept override {}

  void SetAttribute(nostd::string_view key,
                    const opentelemetry::common::AttributeValue& value) noexcept override {
    auto& fields = *record_.mutable_attributes()->mutable_fields();
    detail::SetValue(value, &fields[std::string(key.data(), key.size())]);
  }

  void SetResource(const opentelemetry::sdk::resource::Resource& resource) noexcept override {
    detail::FillResource(resource, record_.mutable_resource());
  }

  void SetInstrumentationScope(
      const opentelemetry::sdk::instrumentationscope::InstrumentationScope& scope) noexcept
      override {
    record_.set_scope(detail::ScopeName(scope));
  }

  const emitcore::v1::LogRecord& record() const {
    return record_;
  }

 private:
  emitcore::v1::LogRecord record_;
};

}  // namespace

FileLogRecordExporter::FileLogRecordExporter(std::shared_ptr<JsonLinesFile> file)
    : file_(std::move(file)) {}

std::unique_ptr<opentelemetry::sdk::logs::Recordable>
FileLogRecordExporter::MakeRecordable() noexcept {
  return std::make_unique<FileLogRecordable>();
}

sdk_common::ExportResult FileLogRecordExporter::Export(
    const nostd::span<std::unique_ptr<opentelemetry::sdk::logs::Recordable>>& records) noexcept {
  if (is_shutdown_.load()) {
    return sdk_common::ExportResult::kFailure;
  }

  try {
    std::vector<emitcore::v1::LogRecord> out;
    out.reserve(records.size());

    for (auto& recordable : records) {
      auto* log = static_cast<FileLogRecordable*>(recordable.get());
      if (log) {
        out.push_back(log->record());
      }
    }
    return WriteRecords(*file_, out);
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("file log export failed: {}", ex.what());
    return sdk_common::ExportResult::kFailure;
  }
}

bool FileLogRecordExporter::ForceFlush(std::chrono::microseconds) noexcept {
  return true;
}

bool FileLogRecordExporter::Shutdown(std::chrono::microseconds) noexcept {
  is_shutdown_ = true;
  file_->Close();
  return true;
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------
static double ToDouble(const metrics_sdk::ValueType& value) {
  if (nostd::holds_alternative<double>(value)) {
    return nostd::get<double>(value);
  }
  return static_cast<double>(nostd::get<int64_t>(value));
}

static const char* TemporalityName(metrics_sdk::AggregationTemporality temporality) {
  switch (temporality) {
    case metrics_sdk::AggregationTemporality::kDelta:
      return "delta";
    case metrics_sdk::AggregationTemporality::kCumulative:
      return "cumulative";
    default:
      return "unspecified";
  }
}

// False for point kinds the file format does not carry (drop).
static bool FillPoint(const metrics_sdk::PointType& point, emitcore::v1::MetricPoint* out) {
  if (nostd::holds_alternative<metrics_sdk::SumPointData>(point)) {
    out->set_sum(ToDouble(nostd::get<metrics_sdk::SumPointData>(point).value_));
    return true;
  }

  if (nostd::holds_alternative<metrics_sdk::HistogramPointData>(point)) {
    const auto& data = nostd::get<metrics_sdk::HistogramPointData>(point);
    auto* histogram = out->mutable_histogram();
    histogram->set_count(data.count_);
    histogram->set_sum(ToDouble(data.sum_));
    if (data.record_min_max_) {
      histogram->set_min(ToDouble(data.min_));
      histogram->set_max(ToDouble(data.max_));
    }
    for (double bound : data.boundaries_) {
      histogram->add_bounds(bound);
    }
    for (uint64_t count : data.counts_) {
      histogram->add_bucket_counts(count);
    }
    return true;
  }

  if (nostd::holds_alternative<metrics_sdk::LastValuePointData>(point)) {
    out->set_last_value(ToDouble(nostd::get<metrics_sdk::LastValuePointData>(point).value_));
    return true;
  }

  return false;
}

emitcore::v1::MetricRecord ToMetricRecord(const metrics_sdk::ResourceMetrics& data) {
  emitcore::v1::MetricRecord record;

  if (data.resource_) {
    detail::FillResource(*data.resource_, record.mutable_resource());
  }

  for (const auto& scope_metrics : data.scope_metric_data_) {
    const std::string scope =
        scope_metrics.scope_ ? detail::ScopeName(*scope_metrics.scope_) : std::string();

    for (const auto& metric : scope_metrics.metric_data_) {
      auto* out = record.add_metrics();
      out->set_name(metric.instrument_descriptor.name_);
      out->set_description(metric.instrument_descriptor.description_);
      out->set_unit(metric.instrument_descriptor.unit_);
      out->set_scope(scope);
      out->set_temporality(TemporalityName(metric.aggregation_temporality));
      out->set_start_time_unix_nano(detail::UnixNanos(metric.start_ts));
      out->set_end_time_unix_nano(detail::UnixNanos(metric.end_ts));

      for (const auto& point : metric.point_data_attr_) {
        emitcore::v1::MetricPoint converted;
        detail::FillStruct(point.attributes, converted.mutable_attributes());
        if (FillPoint(point.point_data, &converted)) {
          *out->add_points() = std::move(converted);
        }
      }
    }
  }

  return record;
}

FileMetricExporter::FileMetricExporter(std::shared_ptr<JsonLinesFile> file)
    : file_(std::move(file)) {}

sdk_common::ExportResult FileMetricExporter::Export(
    const metrics_sdk::ResourceMetrics& data) noexcept {
  if (is_shutdown_.load()) {
    return sdk_common::ExportResult::kFailure;
  }

  try {
    return WriteRecords(*file_, std::vector<emitcore::v1::MetricRecord>{ToMetricRecord(data)});
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("file metric export failed: {}", ex.what());
    return sdk_common::ExportResult::kFailure;
  }
}

metrics_sdk::AggregationTemporality FileMetricExporter::GetAggregationTemporality(
    metrics_sdk::InstrumentType) const noexcept {
  return metrics_sdk::AggregationTemporality::kCumulative;
}

bool FileMetricExporter::ForceFlush(std::chrono::microseconds) noexcept {
  return true;
}

bool FileMetricExporter::Shutdown(std::chrono::microseconds) noexcept {
  is_shutdown_ = true;
  file_->Close();
  return true;
}

}  // namespace emitcore::exporters
