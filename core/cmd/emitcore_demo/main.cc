#include <chrono>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include "emitcore/config/resolver.h"
#include "emitcore/config/settings_loader.h"
#include "emitcore/observability/logging.h"
#include "emitcore/telemetry/telemetry_service.h"
#include "emitcore/v1/settings.pb.h"

// ============================================================
// Helpers
// ============================================================

// Random hex id for this process run.
static std::string NewSessionId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::ostringstream out;
  out << std::hex << gen() << gen();
  return out.str();
}

// ============================================================
// Main
// ============================================================

int main(int argc, char** argv) {
  // ----------------------------------------------------------
  // Argument parsing
  // ----------------------------------------------------------
  //
  // One optional argument: a host settings file (YAML or JSON).
  // Without it, configuration comes from the environment alone.
  //
  if (argc > 2) {
    std::cerr << "usage: emitcore_demo [settings.yaml|settings.json]\n";
    return 1;
  }

  emitcore::v1::HostSettings settings;
  if (argc == 2) {
    std::string error;
    if (!emitcore::config::LoadSettingsFile(argv[1], settings, &error)) {
      std::cerr << "failed to load settings: " << error << "\n";
      return 1;
    }
  }

  // ----------------------------------------------------------
  // Configuration
  // ----------------------------------------------------------
  //
  // Resolved once per process. The environment is captured here
  // and nowhere else.
  //
  const auto env = emitcore::config::CaptureEnvironment();
  const auto config = emitcore::config::Resolve({
      .env = env,
      .settings = settings,
      .service_version = "0.1.0",
      .session_id = NewSessionId(),
      .host_telemetry_level = settings.has_telemetry_level() ? settings.telemetry_level() : "",
  });

  emitcore::observability::InitLocalLogging(config.log_level);

  EC_LOG_INFO_FMT("telemetry {} (exporter={}, endpoint={})",
                  config.enabled ? "enabled" : "disabled",
                  emitcore::config::ToString(config.exporter_kind), config.endpoint);

  // ----------------------------------------------------------
  // Telemetry service
  // ----------------------------------------------------------
  //
  // Calls below are made immediately: while the backend is still
  // initializing they are buffered and replayed in order.
  //
  auto telemetry = emitcore::telemetry::CreateTelemetryService(config);

  telemetry->IncrementCounter("emitcore.demo.runs");

  const int answer = telemetry->StartActiveSpan(
      "demo.compute", {.kind = emitcore::telemetry::SpanKind::Internal,
                       .attributes = {{"demo.input", int64_t{6}}}},
      [&](emitcore::telemetry::SpanHandle& span) {
        const auto start = std::chrono::steady_clock::now();
        const int result = 6 * 7;

        span.SetAttribute("demo.result", int64_t{result});
        span.SetStatus(emitcore::telemetry::SpanStatusCode::Ok);

        const std::chrono::duration<double, std::milli> elapsed =
            std::chrono::steady_clock::now() - start;
        telemetry->RecordMetric("emitcore.demo.compute_ms", elapsed.count(),
                                {{"demo.op", std::string("multiply")}});
        return result;
      });

  auto failing = telemetry->StartSpan("demo.failure");
  failing->RecordException(std::runtime_error("simulated failure"));
  failing->SetStatus(emitcore::telemetry::SpanStatusCode::Error, "simulated failure");
  failing->End();

  telemetry->EmitLogRecord("demo finished",
                           {{"demo.answer", int64_t{answer}}, {"demo.ok", true}});

  // ----------------------------------------------------------
  // Shutdown
  // ----------------------------------------------------------
  //
  // Waits for initialization to settle, flushes pending batches
  // and stops exporters. Never throws.
  //
  if (!telemetry->Flush(std::chrono::seconds(5))) {
    EC_LOG_WARN_FMT("telemetry flush did not complete");
  }
  telemetry->Shutdown();

  return 0;
}
