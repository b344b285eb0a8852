#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "emitcore/observability/logging.h"

namespace emitcore::config {

// Backend an enabled configuration exports to.
enum class ExporterKind {
  OtlpGrpc,
  OtlpHttp,
  Console,
  File,
};

enum class OtlpProtocol {
  Grpc,
  Http,
};

// Per-signal OTLP endpoint overrides. Already normalized.
struct SignalEndpoints {
  std::optional<std::string> traces;
  std::optional<std::string> metrics;
  std::optional<std::string> logs;

  bool operator==(const SignalEndpoints&) const = default;
};

// ------------------------------------------------------------
// Configuration
// ------------------------------------------------------------
// Resolved once per process by config::Resolve() and never
// mutated afterwards. Consumers keep it as a const member.
//
// A disabled configuration is still a complete value: every
// field carries a safe default.
//
struct Configuration {
  bool enabled = false;

  ExporterKind exporter_kind = ExporterKind::OtlpHttp;
  std::string endpoint;  // grpc: origin only, http: full URL
  OtlpProtocol protocol = OtlpProtocol::Http;
  SignalEndpoints signal_endpoints;

  bool capture_content = false;
  std::optional<std::string> file_path;
  observability::LogLevel log_level = observability::LogLevel::Info;
  bool http_auto_instrument = false;

  std::string service_name;
  std::string service_version;
  std::string session_id;
  std::map<std::string, std::string> resource_attributes;

  // OTLP request headers (authentication)
  std::map<std::string, std::string> headers;

  // Export cadence
  std::chrono::milliseconds metric_export_interval{10000};
  std::optional<std::chrono::milliseconds> span_schedule_delay;
  std::optional<std::chrono::milliseconds> log_schedule_delay;

  // Cardinality control: drop histogram aggregation
  bool metrics_counters_only = false;

  bool operator==(const Configuration&) const = default;
};

std::string_view ToString(ExporterKind kind) noexcept;
std::string_view ToString(OtlpProtocol protocol) noexcept;

// Parse "otlp-grpc" | "otlp-http" | "console" | "file".
std::optional<ExporterKind> ParseExporterKind(std::string_view name) noexcept;

}  // namespace emitcore::config
