#pragma once

#include <memory>
#include <string>
#include <string_view>

// ---- OpenTelemetry: exporter interfaces (SDK)
#include <opentelemetry/sdk/logs/exporter.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>
#include <opentelemetry/sdk/trace/exporter.h>

#include "emitcore/config/configuration.h"

namespace emitcore::exporters {

enum class Signal {
  Traces,
  Metrics,
  Logs,
};

// The three sinks of one backend. Either all three exist or the
// factory threw.
struct ExporterSet {
  std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> span;
  std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> log;
  std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> metric;
};

// ------------------------------------------------------------
// ExporterFactory
// ------------------------------------------------------------
// Builds the exporters for a configuration. Called at most once
// per service, from its initialization thread, and never for a
// disabled configuration.
//
// Failure is reported by throwing.
//
class ExporterFactory {
 public:
  virtual ~ExporterFactory() = default;

  virtual ExporterSet Create(const config::Configuration& config) = 0;
};

// Selects the exporters from config.exporter_kind:
//  - File:     JSON lines appended to config.file_path
//  - Console:  opentelemetry ostream exporters on stderr
//  - OtlpGrpc: OTLP over gRPC to config.endpoint
//  - OtlpHttp: OTLP over HTTP, see OtlpHttpUrl()
class DefaultExporterFactory final : public ExporterFactory {
 public:
  ExporterSet Create(const config::Configuration& config) override;
};

// URL the OTLP/HTTP exporter of `signal` posts to: the per-signal
// override when present, else the endpoint with the signal's
// standard path appended when the endpoint has no path of its own,
// else the endpoint as-is.
std::string OtlpHttpUrl(const config::Configuration& config, Signal signal);

// Target of the OTLP/gRPC exporter of `signal`.
std::string OtlpGrpcEndpoint(const config::Configuration& config, Signal signal);

std::string_view ToString(Signal signal) noexcept;

}  // namespace emitcore::exporters
