#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "emitcore/config/configuration.h"
#include "emitcore/v1/settings.pb.h"

namespace emitcore::config {

// Snapshot of environment variables, keyed by name.
using Environment = std::map<std::string, std::string>;

// Built-in values used when nothing else decides.
inline constexpr std::string_view kDefaultEndpoint = "http://localhost:4318";
inline constexpr std::string_view kDefaultServiceName = "emitcore";

// Environment variable names.
//
// EMITCORE_OTEL_* override the standard OTEL_* variables, which
// override host settings, which override built-in defaults.
namespace env {
inline constexpr char kEnabled[] = "EMITCORE_OTEL_ENABLED";
inline constexpr char kProtocol[] = "EMITCORE_OTEL_PROTOCOL";
inline constexpr char kEndpoint[] = "EMITCORE_OTEL_ENDPOINT";
inline constexpr char kFileExporterPath[] = "EMITCORE_OTEL_FILE_EXPORTER_PATH";
inline constexpr char kCaptureContent[] = "EMITCORE_OTEL_CAPTURE_CONTENT";
inline constexpr char kLogLevel[] = "EMITCORE_OTEL_LOG_LEVEL";
inline constexpr char kHttpInstrumentation[] = "EMITCORE_OTEL_HTTP_INSTRUMENTATION";
inline constexpr char kMetricsCountersOnly[] = "EMITCORE_OTEL_METRICS_COUNTERS_ONLY";

inline constexpr char kOtlpEndpoint[] = "OTEL_EXPORTER_OTLP_ENDPOINT";
inline constexpr char kOtlpProtocol[] = "OTEL_EXPORTER_OTLP_PROTOCOL";
inline constexpr char kOtlpTracesEndpoint[] = "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT";
inline constexpr char kOtlpMetricsEndpoint[] = "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
inline constexpr char kOtlpLogsEndpoint[] = "OTEL_EXPORTER_OTLP_LOGS_ENDPOINT";
inline constexpr char kOtlpHeaders[] = "OTEL_EXPORTER_OTLP_HEADERS";
inline constexpr char kServiceName[] = "OTEL_SERVICE_NAME";
inline constexpr char kResourceAttributes[] = "OTEL_RESOURCE_ATTRIBUTES";
inline constexpr char kMetricExportInterval[] = "OTEL_METRIC_EXPORT_INTERVAL";
inline constexpr char kSpanScheduleDelay[] = "OTEL_BSP_SCHEDULE_DELAY";
inline constexpr char kLogScheduleDelay[] = "OTEL_BLRP_SCHEDULE_DELAY";
}  // namespace env

struct ResolveInput {
  const Environment& env;
  const emitcore::v1::HostSettings& settings;
  std::string service_version;
  std::string session_id;
  // Host-wide telemetry level; "off" is the global kill switch.
  std::string host_telemetry_level;
};

// ------------------------------------------------------------
// Resolve
// ------------------------------------------------------------
// Merge environment, host settings and defaults into a single
// Configuration. Pure and deterministic; never throws. Every
// malformed input degrades to its default.
//
Configuration Resolve(const ResolveInput& input) noexcept;

// Read the process environment. This function is the *only*
// place environment variables are read.
Environment CaptureEnvironment();

// Parse "k1=v1,k2=v2". Pairs without '=' or with an empty key
// are skipped; later duplicates overwrite earlier ones.
std::map<std::string, std::string> ParseKeyValueList(std::string_view raw);

// Strip wrapping quotes, parse as an http(s) URL and normalize it
// for the protocol: grpc keeps the origin, http keeps the full URL.
// Returns nullopt when the value is not a usable URL.
std::optional<std::string> NormalizeEndpoint(std::string_view raw, OtlpProtocol protocol);

}  // namespace emitcore::config
