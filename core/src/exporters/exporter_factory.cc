#include "emitcore/exporters/exporter_factory.h"

#include <iostream>
#include <stdexcept>

// ---- OpenTelemetry: OTLP exporters
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_log_record_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_log_record_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_log_record_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_log_record_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>

// ---- OpenTelemetry: ostream exporters
#include <opentelemetry/exporters/ostream/log_record_exporter_factory.h>
#include <opentelemetry/exporters/ostream/metric_exporter_factory.h>
#include <opentelemetry/exporters/ostream/span_exporter_factory.h>

#include "emitcore/exporters/file_exporters.h"
#include "emitcore/observability/logging.h"
#include "emitcore/util/url.h"

namespace otlp = opentelemetry::exporter::otlp;

namespace emitcore::exporters {

std::string_view ToString(Signal signal) noexcept {
  switch (signal) {
    case Signal::Traces:
      return "traces";
    case Signal::Metrics:
      return "metrics";
    case Signal::Logs:
      return "logs";
  }
  return "unknown";
}

static const std::optional<std::string>& SignalOverride(const config::Configuration& config,
                                                        Signal signal) {
  switch (signal) {
    case Signal::Traces:
      return config.signal_endpoints.traces;
    case Signal::Metrics:
      return config.signal_endpoints.metrics;
    case Signal::Logs:
      break;
  }
  return config.signal_endpoints.logs;
}

std::string OtlpHttpUrl(const config::Configuration& config, Signal signal) {
  if (const auto& override_url = SignalOverride(config, signal)) {
    return *override_url;
  }

  auto url = util::ParseUrl(config.endpoint);
  if (!url || url->path != "/") {
    return config.endpoint;
  }

  url->path = "/v1/" + std::string(ToString(signal));
  return url->Href();
}

std::string OtlpGrpcEndpoint(const config::Configuration& config, Signal signal) {
  if (const auto& override_url = SignalOverride(config, signal)) {
    return *override_url;
  }
  return config.endpoint;
}

static bool UseTls(const std::string& endpoint) {
  return endpoint.rfind("https://", 0) == 0;
}

// ------------------------------------------------------------
// Per-kind construction
// ------------------------------------------------------------
static ExporterSet CreateFileExporters(const config::Configuration& config) {
  if (!config.file_path || config.file_path->empty()) {
    throw std::runtime_error("file exporter selected without a file path");
  }

  const std::string& path = *config.file_path;

  // One append stream per signal; opening throws on failure
  ExporterSet set;
  set.span = std::make_unique<FileSpanExporter>(std::make_shared<JsonLinesFile>(path));
  set.log = std::make_unique<FileLogRecordExporter>(std::make_shared<JsonLinesFile>(path));
  set.metric = std::make_unique<FileMetricExporter>(std::make_shared<JsonLinesFile>(path));
  return set;
}

static ExporterSet CreateConsoleExporters() {
  ExporterSet set;
  set.span = opentelemetry::exporter::trace::OStreamSpanExporterFactory::Create(std::cerr);
  set.log = opentelemetry::exporter::logs::OStreamLogRecordExporterFactory::Create(std::cerr);
  set.metric = opentelemetry::exporter::metrics::OStreamMetricExporterFactory::Create(std::cerr);
  return set;
}

static ExporterSet CreateOtlpGrpcExporters(const config::Configuration& config) {
  ExporterSet set;

  {
    otlp::OtlpGrpcExporterOptions opts;
    opts.endpoint = OtlpGrpcEndpoint(config, Signal::Traces);
    opts.use_ssl_credentials = UseTls(opts.endpoint);
    for (const auto& [key, value] : config.headers) {
      opts.metadata.insert({key, value});
    }
    set.span = otlp::OtlpGrpcExporterFactory::Create(opts);
  }

  {
    otlp::OtlpGrpcLogRecordExporterOptions opts;
    opts.endpoint = OtlpGrpcEndpoint(config, Signal::Logs);
    opts.use_ssl_credentials = UseTls(opts.endpoint);
    for (const auto& [key, value] : config.headers) {
      opts.metadata.insert({key, value});
    }
    set.log = otlp::OtlpGrpcLogRecordExporterFactory::Create(opts);
  }

  {
    otlp::OtlpGrpcMetricExporterOptions opts;
    opts.endpoint = OtlpGrpcEndpoint(config, Signal::Metrics);
    opts.use_ssl_credentials = UseTls(opts.endpoint);
    for (const auto& [key, value] : config.headers) {
      opts.metadata.insert({key, value});
    }
    set.metric = otlp::OtlpGrpcMetricExporterFactory::Create(opts);
  }

  return set;
}

static ExporterSet CreateOtlpHttpExporters(const config::Configuration& config) {
  ExporterSet set;

  {
    otlp::OtlpHttpExporterOptions opts;
    opts.url = OtlpHttpUrl(config, Signal::Traces);
    for (const auto& [key, value] : config.headers) {
      opts.http_headers.insert({key, value});
    }
    set.span = otlp::OtlpHttpExporterFactory::Create(opts);
  }

  {
    otlp::OtlpHttpLogRecordExporterOptions opts;
    opts.url = OtlpHttpUrl(config, Signal::Logs);
    for (const auto& [key, value] : config.headers) {
      opts.http_headers.insert({key, value});
    }
    set.log = otlp::OtlpHttpLogRecordExporterFactory::Create(opts);
  }

  {
    otlp::OtlpHttpMetricExporterOptions opts;
    opts.url = OtlpHttpUrl(config, Signal::Metrics);
    for (const auto& [key, value] : config.headers) {
      opts.http_headers.insert({key, value});
    }
    set.metric = otlp::OtlpHttpMetricExporterFactory::Create(opts);
  }

  return set;
}

// ------------------------------------------------------------
// DefaultExporterFactory
// ------------------------------------------------------------
ExporterSet DefaultExporterFactory::Create(const config::Configuration& config) {
  ExporterSet set;

  switch (config.exporter_kind) {
    case config::ExporterKind::File:
      set = CreateFileExporters(config);
      break;
    case config::ExporterKind::Console:
      set = CreateConsoleExporters();
      break;
    case config::ExporterKind::OtlpGrpc:
      set = CreateOtlpGrpcExporters(config);
      break;
    case config::ExporterKind::OtlpHttp:
      set = CreateOtlpHttpExporters(config);
      break;
  }

  if (!set.span || !set.log || !set.metric) {
    throw std::runtime_error("exporter construction incomplete for kind " +
                             std::string(config::ToString(config.exporter_kind)));
  }

  EC_LOG_DEBUG_FMT("exporters created (kind={})", config::ToString(config.exporter_kind));
  return set;
}

}  // namespace emitcore::exporters
