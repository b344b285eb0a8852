#include "emitcore/exporters/diagnostic_span_exporter.h"

#include <opentelemetry/sdk/common/exporter_utils.h>

#include "emitcore/observability/logging.h"

namespace sdk_common = opentelemetry::sdk::common;

namespace emitcore::exporters {

DiagnosticSpanExporter::DiagnosticSpanExporter(
    std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> inner, std::string exporter_kind)
    : inner_(std::move(inner)), exporter_kind_(std::move(exporter_kind)) {}

std::unique_ptr<opentelemetry::sdk::trace::Recordable>
DiagnosticSpanExporter::MakeRecordable() noexcept {
  return inner_->MakeRecordable();
}

sdk_common::ExportResult DiagnosticSpanExporter::Export(
    const opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::trace::Recordable>>&
        spans) noexcept {
  const std::size_t count = spans.size();
  const auto result = inner_->Export(spans);

  if (result == sdk_common::ExportResult::kSuccess) {
    if (!reported_success_.exchange(true)) {
      EC_LOG_INFO_FMT("first span export succeeded (exporter={}, spans={})", exporter_kind_,
                      count);
    }
  } else {
    EC_LOG_WARN_FMT("span export failed (exporter={}, result={}, spans={})", exporter_kind_,
                    sdk_common::GetExportResultString(result), count);
  }

  return result;
}

bool DiagnosticSpanExporter::ForceFlush(std::chrono::microseconds timeout) noexcept {
  return inner_->ForceFlush(timeout);
}

bool DiagnosticSpanExporter::Shutdown(std::chrono::microseconds timeout) noexcept {
  return inner_->Shutdown(timeout);
}

}  // namespace emitcore::exporters
