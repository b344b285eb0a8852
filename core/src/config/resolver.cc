#include "emitcore/config/resolver.h"

#include <charconv>
#include <exception>

#include "emitcore/util/url.h"

extern char** environ;

namespace emitcore::config {

using observability::LogLevel;

// ------------------------------------------------------------
// Env lookup helpers
// ------------------------------------------------------------

static std::optional<std::string> GetEnvString(const Environment& vars, const char* key) {
  auto it = vars.find(key);
  if (it == vars.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Defined env bool: "1" / "true" → true, anything else → false
static std::optional<bool> GetEnvBool(const Environment& vars, const char* key) {
  auto v = GetEnvString(vars, key);
  if (!v) {
    return std::nullopt;
  }
  return *v == "1" || *v == "true";
}

static std::optional<std::chrono::milliseconds> GetEnvMillis(const Environment& vars,
                                                             const char* key) {
  auto v = GetEnvString(vars, key);
  if (!v || v->empty()) {
    return std::nullopt;
  }
  long long ms = 0;
  auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), ms);
  if (ec != std::errc{} || ptr != v->data() + v->size() || ms <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(ms);
}

static std::optional<LogLevel> ParseLogLevel(std::string_view name) {
  if (name == "trace")
    return LogLevel::Trace;
  if (name == "debug")
    return LogLevel::Debug;
  if (name == "info")
    return LogLevel::Info;
  if (name == "warn")
    return LogLevel::Warn;
  if (name == "error")
    return LogLevel::Error;
  return std::nullopt;
}

static std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

// ------------------------------------------------------------
// Disabled snapshot
// ------------------------------------------------------------
static Configuration MakeDisabled(const ResolveInput& input) {
  Configuration cfg;
  cfg.enabled = false;
  cfg.exporter_kind = ExporterKind::OtlpHttp;
  cfg.protocol = OtlpProtocol::Http;
  cfg.service_name = std::string(kDefaultServiceName);
  cfg.service_version = input.service_version;
  cfg.session_id = input.session_id;
  return cfg;
}

std::map<std::string, std::string> ParseKeyValueList(std::string_view raw) {
  std::map<std::string, std::string> out;

  while (!raw.empty()) {
    const auto comma = raw.find(',');
    std::string_view pair = raw.substr(0, comma);
    raw = comma == std::string_view::npos ? std::string_view{} : raw.substr(comma + 1);

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }

    std::string_view key = Trim(pair.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    out[std::string(key)] = std::string(Trim(pair.substr(eq + 1)));
  }

  return out;
}

std::optional<std::string> NormalizeEndpoint(std::string_view raw, OtlpProtocol protocol) {
  // One wrapping quote at each end, as left behind by shells and .env files
  if (!raw.empty() && (raw.front() == '"' || raw.front() == '\'')) {
    raw.remove_prefix(1);
  }
  if (!raw.empty() && (raw.back() == '"' || raw.back() == '\'')) {
    raw.remove_suffix(1);
  }

  auto url = util::ParseUrl(raw);
  if (!url) {
    return std::nullopt;
  }

  // gRPC does not route by path; HTTP collectors do
  return protocol == OtlpProtocol::Grpc ? url->Origin() : url->Href();
}

// ------------------------------------------------------------
// Resolve
// ------------------------------------------------------------
static Configuration ResolveEnabled(const ResolveInput& input) {
  const auto& vars = input.env;
  const auto& settings = input.settings;

  Configuration cfg;
  cfg.enabled = true;

  // ----------------------------------------------------------
  // Protocol: grpc only when explicitly requested
  // ----------------------------------------------------------
  auto raw_protocol = GetEnvString(vars, env::kOtlpProtocol);
  if (!raw_protocol) {
    raw_protocol = GetEnvString(vars, env::kProtocol);
  }
  cfg.protocol = raw_protocol == "grpc" ? OtlpProtocol::Grpc : OtlpProtocol::Http;

  // ----------------------------------------------------------
  // Endpoint: app env > standard env > setting > default
  // ----------------------------------------------------------
  std::string raw_endpoint(kDefaultEndpoint);
  if (auto v = GetEnvString(vars, env::kEndpoint)) {
    raw_endpoint = *v;
  } else if (auto v = GetEnvString(vars, env::kOtlpEndpoint)) {
    raw_endpoint = *v;
  } else if (settings.has_otlp_endpoint()) {
    raw_endpoint = settings.otlp_endpoint();
  }

  auto endpoint = NormalizeEndpoint(raw_endpoint, cfg.protocol);
  if (!endpoint) {
    endpoint = NormalizeEndpoint(kDefaultEndpoint, cfg.protocol);
  }
  cfg.endpoint = *endpoint;

  // Per-signal overrides: invalid values are ignored
  auto signal_endpoint = [&](const char* key) -> std::optional<std::string> {
    auto v = GetEnvString(vars, key);
    return v ? NormalizeEndpoint(*v, cfg.protocol) : std::nullopt;
  };
  cfg.signal_endpoints.traces = signal_endpoint(env::kOtlpTracesEndpoint);
  cfg.signal_endpoints.metrics = signal_endpoint(env::kOtlpMetricsEndpoint);
  cfg.signal_endpoints.logs = signal_endpoint(env::kOtlpLogsEndpoint);

  // ----------------------------------------------------------
  // Exporter kind: a file path always wins
  // ----------------------------------------------------------
  // A defined env value, even empty, shadows the host setting
  if (auto v = GetEnvString(vars, env::kFileExporterPath)) {
    if (!v->empty()) {
      cfg.file_path = *v;
    }
  } else if (settings.has_outfile() && !settings.outfile().empty()) {
    cfg.file_path = settings.outfile();
  }

  std::optional<ExporterKind> setting_kind;
  if (settings.has_exporter_type()) {
    setting_kind = ParseExporterKind(settings.exporter_type());
  }

  if (cfg.file_path) {
    cfg.exporter_kind = ExporterKind::File;
  } else if (setting_kind && *setting_kind != ExporterKind::File) {
    cfg.exporter_kind = *setting_kind;
  } else {
    cfg.exporter_kind =
        cfg.protocol == OtlpProtocol::Grpc ? ExporterKind::OtlpGrpc : ExporterKind::OtlpHttp;
  }

  // ----------------------------------------------------------
  // Content capture is never on unless asked for
  // ----------------------------------------------------------
  if (auto v = GetEnvBool(vars, env::kCaptureContent)) {
    cfg.capture_content = *v;
  } else if (settings.has_capture_content()) {
    cfg.capture_content = settings.capture_content();
  } else {
    cfg.capture_content = false;
  }

  if (auto v = GetEnvString(vars, env::kLogLevel)) {
    cfg.log_level = ParseLogLevel(*v).value_or(LogLevel::Info);
  }

  cfg.http_auto_instrument = GetEnvBool(vars, env::kHttpInstrumentation).value_or(false);
  cfg.metrics_counters_only = GetEnvBool(vars, env::kMetricsCountersOnly).value_or(false);

  // ----------------------------------------------------------
  // Identity
  // ----------------------------------------------------------
  cfg.service_name =
      GetEnvString(vars, env::kServiceName).value_or(std::string(kDefaultServiceName));
  cfg.service_version = input.service_version;
  cfg.session_id = input.session_id;

  if (auto v = GetEnvString(vars, env::kResourceAttributes)) {
    cfg.resource_attributes = ParseKeyValueList(*v);
  }
  if (auto v = GetEnvString(vars, env::kOtlpHeaders)) {
    cfg.headers = ParseKeyValueList(*v);
  }

  // ----------------------------------------------------------
  // Export cadence
  // ----------------------------------------------------------
  if (auto v = GetEnvMillis(vars, env::kMetricExportInterval)) {
    cfg.metric_export_interval = *v;
  }
  cfg.span_schedule_delay = GetEnvMillis(vars, env::kSpanScheduleDelay);
  cfg.log_schedule_delay = GetEnvMillis(vars, env::kLogScheduleDelay);

  return cfg;
}

Configuration Resolve(const ResolveInput& input) noexcept {
  try {
    // Kill switch beats everything
    if (input.host_telemetry_level == "off") {
      return MakeDisabled(input);
    }

    // env > setting > implied by a standard endpoint being present
    bool enabled = false;
    if (auto v = GetEnvBool(input.env, env::kEnabled)) {
      enabled = *v;
    } else if (input.settings.has_enabled()) {
      enabled = input.settings.enabled();
    } else {
      auto it = input.env.find(env::kOtlpEndpoint);
      enabled = it != input.env.end() && !it->second.empty();
    }

    if (!enabled) {
      return MakeDisabled(input);
    }

    return ResolveEnabled(input);
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("[otel] configuration resolution failed, telemetry disabled: {}", ex.what());
    return Configuration{};
  }
}

Environment CaptureEnvironment() {
  Environment env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    const auto eq = kv.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
  }
  return env;
}

}  // namespace emitcore::config
