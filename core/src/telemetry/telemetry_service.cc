#include "emitcore/telemetry/telemetry_service.h"

#include "emitcore/exporters/exporter_factory.h"
#include "emitcore/telemetry/otel_telemetry_service.h"

namespace emitcore::telemetry {

std::string_view ToString(InitState state) noexcept {
  switch (state) {
    case InitState::Uninitialized:
      return "uninitialized";
    case InitState::Initializing:
      return "initializing";
    case InitState::Ready:
      return "ready";
    case InitState::Failed:
      return "failed";
  }
  return "unknown";
}

std::unique_ptr<TelemetryService> CreateTelemetryService(
    config::Configuration config, std::shared_ptr<exporters::ExporterFactory> factory) {
  if (!config.enabled) {
    return std::make_unique<NoopTelemetryService>(std::move(config));
  }

  if (!factory) {
    factory = std::make_shared<exporters::DefaultExporterFactory>();
  }
  return std::make_unique<OtelTelemetryService>(std::move(config), std::move(factory));
}

}  // namespace emitcore::telemetry
