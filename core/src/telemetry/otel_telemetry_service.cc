#include "emitcore/telemetry/otel_telemetry_service.h"

#include <map>
#include <stdexcept>
#include <utility>

// ---- OpenTelemetry: API
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/logs/logger.h>
#include <opentelemetry/logs/noop.h>
#include <opentelemetry/logs/provider.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/tracer.h>

// ---- OpenTelemetry: SDK
#include <opentelemetry/sdk/logs/batch_log_record_processor_factory.h>
#include <opentelemetry/sdk/logs/batch_log_record_processor_options.h>
#include <opentelemetry/sdk/logs/logger_provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_options.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/instrument_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/meter_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/view_factory.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>

#include "emitcore/exporters/diagnostic_span_exporter.h"
#include "emitcore/observability/logging.h"
#include "emitcore/telemetry/buffered_span_handle.h"
#include "otel_attributes.h"

namespace nostd = opentelemetry::nostd;
namespace trace_api = opentelemetry::trace;
namespace logs_api = opentelemetry::logs;
namespace metrics_api = opentelemetry::metrics;
namespace trace_sdk = opentelemetry::sdk::trace;
namespace logs_sdk = opentelemetry::sdk::logs;
namespace metrics_sdk = opentelemetry::sdk::metrics;
namespace resource_sdk = opentelemetry::sdk::resource;

namespace emitcore::telemetry {

// ------------------------------------------------------------
// Backend
// ------------------------------------------------------------
// Everything that exists only once initialization succeeded.
//
struct OtelTelemetryService::Backend {
  struct Instrument {
    InstrumentKind kind;
    nostd::unique_ptr<metrics_api::Histogram<double>> histogram;
    nostd::unique_ptr<metrics_api::Counter<double>> counter;
  };

  std::shared_ptr<trace_sdk::TracerProvider> tracer_provider;
  std::shared_ptr<logs_sdk::LoggerProvider> logger_provider;
  std::shared_ptr<metrics_sdk::MeterProvider> meter_provider;

  nostd::shared_ptr<trace_api::Tracer> tracer;
  nostd::shared_ptr<logs_api::Logger> logger;
  nostd::shared_ptr<metrics_api::Meter> meter;

  // Instrument cache: created on first use, kind fixed per name.
  // Entries are never erased, so pointers into the map stay valid.
  std::mutex instruments_mu;
  std::map<std::string, Instrument, std::less<>> instruments;
};

namespace {

// ------------------------------------------------------------
// OtelSpanHandle
// ------------------------------------------------------------
class OtelSpanScope final : public SpanScope {
 public:
  explicit OtelSpanScope(const nostd::shared_ptr<trace_api::Span>& span) : scope_(span) {}

 private:
  trace_api::Scope scope_;
};

trace_api::SpanKind ToOtel(SpanKind kind) {
  switch (kind) {
    case SpanKind::Server:
      return trace_api::SpanKind::kServer;
    case SpanKind::Client:
      return trace_api::SpanKind::kClient;
    case SpanKind::Producer:
      return trace_api::SpanKind::kProducer;
    case SpanKind::Consumer:
      return trace_api::SpanKind::kConsumer;
    case SpanKind::Internal:
      break;
  }
  return trace_api::SpanKind::kInternal;
}

trace_api::StatusCode ToOtel(SpanStatusCode code) {
  switch (code) {
    case SpanStatusCode::Ok:
      return trace_api::StatusCode::kOk;
    case SpanStatusCode::Error:
      return trace_api::StatusCode::kError;
    case SpanStatusCode::Unset:
      break;
  }
  return trace_api::StatusCode::kUnset;
}

nostd::string_view View(std::string_view s) {
  return nostd::string_view(s.data(), s.size());
}

class OtelSpanHandle final : public SpanHandle {
 public:
  explicit OtelSpanHandle(nostd::shared_ptr<trace_api::Span> span) : span_(std::move(span)) {}

  using SpanHandle::RecordException;

  void SetAttribute(std::string_view key, const AttributeValue& value) noexcept override {
    try {
      std::vector<nostd::string_view> storage;
      span_->SetAttribute(View(key), detail::OtelAttributes::Convert(value, storage));
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("span attribute dropped: {}", ex.what());
    }
  }

  void SetAttributes(const OptionalAttributes& attributes) noexcept override {
    for (const auto& [key, value] : attributes) {
      if (value) {
        SetAttribute(key, *value);
      }
    }
  }

  void SetStatus(SpanStatusCode code, std::string_view message) noexcept override {
    span_->SetStatus(ToOtel(code), View(message));
  }

  void RecordException(std::string_view type, std::string_view message) noexcept override {
    span_->AddEvent("exception", {{"exception.type", View(type)},
                                  {"exception.message", View(message)}});
  }

  void End() noexcept override {
    span_->End();
  }

  std::unique_ptr<SpanScope> Activate() noexcept override {
    try {
      return std::make_unique<OtelSpanScope>(span_);
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("span activation failed: {}", ex.what());
      return nullptr;
    }
  }

 private:
  nostd::shared_ptr<trace_api::Span> span_;
};

// ------------------------------------------------------------
// Provider option mapping
// ------------------------------------------------------------
resource_sdk::Resource CreateResource(const config::Configuration& config) {
  resource_sdk::ResourceAttributes attributes;
  attributes.SetAttribute("service.name", View(config.service_name));
  attributes.SetAttribute("service.version", View(config.service_version));
  attributes.SetAttribute("session.id", View(config.session_id));

  // Custom attributes may override the built-in ones
  for (const auto& [key, value] : config.resource_attributes) {
    attributes.SetAttribute(View(key), View(value));
  }

  return resource_sdk::Resource::Create(attributes);
}

trace_sdk::BatchSpanProcessorOptions CreateBatchTraceOptions(const config::Configuration& config) {
  trace_sdk::BatchSpanProcessorOptions opts;
  if (config.span_schedule_delay) {
    opts.schedule_delay_millis = *config.span_schedule_delay;
  }
  return opts;
}

logs_sdk::BatchLogRecordProcessorOptions CreateBatchLoggingOptions(
    const config::Configuration& config) {
  logs_sdk::BatchLogRecordProcessorOptions opts;
  if (config.log_schedule_delay) {
    opts.schedule_delay_millis = *config.log_schedule_delay;
  }
  return opts;
}

metrics_sdk::PeriodicExportingMetricReaderOptions CreatePeriodicMetricReaderOptions(
    const config::Configuration& config) {
  metrics_sdk::PeriodicExportingMetricReaderOptions opts;
  opts.export_interval_millis = config.metric_export_interval;

  // The SDK requires timeout < interval
  opts.export_timeout_millis = config.metric_export_interval / 2;

  return opts;
}

}  // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
OtelTelemetryService::OtelTelemetryService(config::Configuration config,
                                           std::shared_ptr<exporters::ExporterFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = InitState::Initializing;
  }

  // Initialization starts here and nowhere else
  init_thread_ = std::thread([this] { Initialize(); });
}

OtelTelemetryService::~OtelTelemetryService() {
  Shutdown();
}

InitState OtelTelemetryService::state() const noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool OtelTelemetryService::WaitForInitialization(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return settled_cv_.wait_for(lock, timeout, [this] {
    return state_ == InitState::Ready || state_ == InitState::Failed;
  });
}

std::size_t OtelTelemetryService::pending_operations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return buffer_.size();
}

// ------------------------------------------------------------
// Routing
// ------------------------------------------------------------
// `make_op` is only invoked when the call has to be buffered, so
// the Ready path pays for no closure.
//
template <typename MakeOp>
OtelTelemetryService::Route OtelTelemetryService::RouteCall(MakeOp&& make_op) {
  std::lock_guard<std::mutex> lock(mu_);

  if (shutdown_) {
    return Route::Dropped;
  }

  switch (state_) {
    case InitState::Ready:
      return Route::Apply;
    case InitState::Initializing:
      if (buffer_.size() >= buffer_.capacity()) {
        return Route::Dropped;
      }
      return buffer_.TryPush(make_op()) ? Route::Buffered : Route::Dropped;
    case InitState::Uninitialized:
    case InitState::Failed:
      break;
  }
  return Route::Dropped;
}

// ------------------------------------------------------------
// Spans
// ------------------------------------------------------------
std::shared_ptr<SpanHandle> OtelTelemetryService::StartSpan(std::string_view name,
                                                            const SpanOptions& options) noexcept {
  try {
    std::shared_ptr<BufferedSpanHandle> pending;

    auto route = RouteCall([&] {
      pending = std::make_shared<BufferedSpanHandle>();
      BufferedOperation op;
      op.replay = [this, handle = pending, name = std::string(name), options] {
        handle->Bind(CreateSpan(name, options));
      };
      op.discard = [handle = pending] { handle->Abandon(); };
      return op;
    });

    switch (route) {
      case Route::Apply:
        return CreateSpan(std::string(name), options);
      case Route::Buffered:
        return pending;
      case Route::Dropped:
        break;
    }
  } catch (const std::exception& ex) {
    EC_LOG_DEBUG_FMT("StartSpan({}) failed: {}", name, ex.what());
  }
  return NoopSpan();
}

std::shared_ptr<SpanHandle> OtelTelemetryService::CreateSpan(const std::string& name,
                                                             const SpanOptions& options) {
  trace_api::StartSpanOptions start;
  start.kind = ToOtel(options.kind);

  detail::OtelAttributes attributes(options.attributes);
  return std::make_shared<OtelSpanHandle>(
      backend_->tracer->StartSpan(name, attributes.pairs(), start));
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------
void OtelTelemetryService::RecordMetric(std::string_view name, double value,
                                        const Attributes& attributes) noexcept {
  try {
    auto route = RouteCall([&] {
      return BufferedOperation{[this, name = std::string(name), value, attributes] {
                                 ApplyInstrument(InstrumentKind::Histogram, name, value,
                                                 attributes);
                               },
                               {}};
    });
    if (route == Route::Apply) {
      ApplyInstrument(InstrumentKind::Histogram, std::string(name), value, attributes);
    }
  } catch (const std::exception& ex) {
    EC_LOG_DEBUG_FMT("RecordMetric({}) failed: {}", name, ex.what());
  }
}

void OtelTelemetryService::IncrementCounter(std::string_view name, double value,
                                            const Attributes& attributes) noexcept {
  try {
    auto route = RouteCall([&] {
      return BufferedOperation{[this, name = std::string(name), value, attributes] {
                                 ApplyInstrument(InstrumentKind::Counter, name, value, attributes);
                               },
                               {}};
    });
    if (route == Route::Apply) {
      ApplyInstrument(InstrumentKind::Counter, std::string(name), value, attributes);
    }
  } catch (const std::exception& ex) {
    EC_LOG_DEBUG_FMT("IncrementCounter({}) failed: {}", name, ex.what());
  }
}

void OtelTelemetryService::ApplyInstrument(InstrumentKind kind, const std::string& name,
                                           double value, const Attributes& attributes) {
  auto& backend = *backend_;
  Backend::Instrument* instrument = nullptr;

  {
    std::lock_guard<std::mutex> lock(backend.instruments_mu);

    auto it = backend.instruments.find(name);
    if (it == backend.instruments.end()) {
      Backend::Instrument created{kind, nullptr, nullptr};
      if (kind == InstrumentKind::Histogram) {
        created.histogram = backend.meter->CreateDoubleHistogram(name);
      } else {
        created.counter = backend.meter->CreateDoubleCounter(name);
      }
      it = backend.instruments.emplace(name, std::move(created)).first;
    } else if (it->second.kind != kind) {
      EC_LOG_DEBUG_FMT("metric '{}' already registered as a {}; dropping {} value", name,
                       it->second.kind == InstrumentKind::Histogram ? "histogram" : "counter",
                       kind == InstrumentKind::Histogram ? "histogram" : "counter");
      return;
    }
    instrument = &it->second;
  }

  detail::OtelAttributes labels(attributes);
  auto ctx = opentelemetry::context::RuntimeContext::GetCurrent();

  if (kind == InstrumentKind::Histogram) {
    instrument->histogram->Record(value, labels.view(), ctx);
  } else {
    instrument->counter->Add(value, labels.view(), ctx);
  }
}

// ------------------------------------------------------------
// Logs
// ------------------------------------------------------------
void OtelTelemetryService::EmitLogRecord(std::string_view body,
                                         const Attributes& attributes) noexcept {
  try {
    auto route = RouteCall([&] {
      return BufferedOperation{
          [this, body = std::string(body), attributes] { ApplyLogRecord(body, attributes); }, {}};
    });
    if (route == Route::Apply) {
      ApplyLogRecord(std::string(body), attributes);
    }
  } catch (const std::exception& ex) {
    EC_LOG_DEBUG_FMT("EmitLogRecord failed: {}", ex.what());
  }
}

void OtelTelemetryService::ApplyLogRecord(const std::string& body, const Attributes& attributes) {
  auto& logger = backend_->logger;

  auto record = logger->CreateLogRecord();
  if (!record) {
    return;
  }

  record->SetSeverity(logs_api::Severity::kInfo);
  record->SetBody(View(body));
  record->SetTimestamp(std::chrono::system_clock::now());

  std::vector<nostd::string_view> storage;
  for (const auto& [key, value] : attributes) {
    record->SetAttribute(View(key), detail::OtelAttributes::Convert(value, storage));
  }

  logger->EmitLogRecord(std::move(record));
}

// ------------------------------------------------------------
// Initialization
// ------------------------------------------------------------
void OtelTelemetryService::Initialize() noexcept {
  try {
    auto backend = BuildBackend();
    {
      std::lock_guard<std::mutex> lock(mu_);
      backend_ = std::move(backend);
    }
    Drain();
  } catch (const std::exception& ex) {
    Fail(ex.what());
  } catch (...) {
    Fail("unknown error");
  }
}

std::shared_ptr<OtelTelemetryService::Backend> OtelTelemetryService::BuildBackend() {
  auto exporters = factory_->Create(config_);
  if (!exporters.span || !exporters.log || !exporters.metric) {
    throw std::runtime_error("exporter factory returned an incomplete exporter set");
  }

  auto backend = std::make_shared<Backend>();
  const auto resource = CreateResource(config_);
  const std::string kind(config::ToString(config_.exporter_kind));

  // ----------------------------------------------------------
  // Traces (exporter wrapped with connectivity diagnostics)
  // ----------------------------------------------------------
  {
    std::unique_ptr<trace_sdk::SpanExporter> exporter =
        std::make_unique<exporters::DiagnosticSpanExporter>(std::move(exporters.span), kind);
    auto processor = trace_sdk::BatchSpanProcessorFactory::Create(
        std::move(exporter), CreateBatchTraceOptions(config_));
    backend->tracer_provider =
        std::make_shared<trace_sdk::TracerProvider>(std::move(processor), resource);
  }

  // ----------------------------------------------------------
  // Logs
  // ----------------------------------------------------------
  {
    auto processor = logs_sdk::BatchLogRecordProcessorFactory::Create(
        std::move(exporters.log), CreateBatchLoggingOptions(config_));
    backend->logger_provider =
        std::make_shared<logs_sdk::LoggerProvider>(std::move(processor), resource);
  }

  // ----------------------------------------------------------
  // Metrics
  // ----------------------------------------------------------
  {
    backend->meter_provider = std::make_shared<metrics_sdk::MeterProvider>(
        std::make_unique<metrics_sdk::ViewRegistry>(), resource);

    // Counters-only mode: histograms are aggregated into nothing
    if (config_.metrics_counters_only) {
      backend->meter_provider->AddView(
          metrics_sdk::InstrumentSelectorFactory::Create(metrics_sdk::InstrumentType::kHistogram,
                                                         "*", ""),
          metrics_sdk::MeterSelectorFactory::Create("", "", ""),
          metrics_sdk::ViewFactory::Create("", "", "", metrics_sdk::AggregationType::kDrop));
    }

    auto reader = metrics_sdk::PeriodicExportingMetricReaderFactory::Create(
        std::move(exporters.metric), CreatePeriodicMetricReaderOptions(config_));
    backend->meter_provider->AddMetricReader(std::move(reader));
  }

  // ----------------------------------------------------------
  // Providers (SDK → API)
  // ----------------------------------------------------------
  std::shared_ptr<trace_api::TracerProvider> api_tracer_provider = backend->tracer_provider;
  trace_api::Provider::SetTracerProvider(api_tracer_provider);

  std::shared_ptr<logs_api::LoggerProvider> api_logger_provider = backend->logger_provider;
  logs_api::Provider::SetLoggerProvider(api_logger_provider);

  std::shared_ptr<metrics_api::MeterProvider> api_meter_provider = backend->meter_provider;
  metrics_api::Provider::SetMeterProvider(api_meter_provider);

  backend->tracer = api_tracer_provider->GetTracer(config_.service_name, config_.service_version);
  backend->logger = api_logger_provider->GetLogger(config_.service_name, config_.service_name,
                                                   config_.service_version);
  backend->meter = api_meter_provider->GetMeter(config_.service_name, config_.service_version);

  EC_LOG_DEBUG_FMT("telemetry backend ready (exporter={}, service={})", kind,
                   config_.service_name);
  return backend;
}

void OtelTelemetryService::Drain() {
  std::size_t replayed = 0;

  for (;;) {
    std::vector<BufferedOperation> chunk;
    {
      std::lock_guard<std::mutex> lock(mu_);
      chunk = buffer_.TakeChunk(kDrainChunkSize);

      // Calls made during the drain were appended behind the
      // chunks already taken, so Ready is only safe once empty.
      if (chunk.empty()) {
        state_ = InitState::Ready;
        break;
      }
    }

    replayed += ReplayChunk(chunk);

    std::this_thread::yield();
  }

  settled_cv_.notify_all();

  if (replayed > 0) {
    EC_LOG_DEBUG_FMT("replayed {} buffered telemetry operations", replayed);
  }
}

void OtelTelemetryService::Fail(const std::string& reason) noexcept {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = InitState::Failed;
    dropped = buffer_.Discard();
  }
  settled_cv_.notify_all();

  EC_LOG_ERROR_FMT("telemetry initialization failed, emission disabled: {} ({} buffered "
                   "operations discarded)",
                   reason, dropped);
}

// ------------------------------------------------------------
// Flush / Shutdown
// ------------------------------------------------------------
bool OtelTelemetryService::Flush(std::chrono::milliseconds timeout) noexcept {
  std::shared_ptr<Backend> backend;
  {
    std::lock_guard<std::mutex> lock(mu_);
    backend = backend_;
  }
  if (!backend) {
    return true;
  }

  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout);
  bool ok = true;
  try {
    ok &= backend->tracer_provider->ForceFlush(micros);
    ok &= backend->logger_provider->ForceFlush(micros);
    ok &= backend->meter_provider->ForceFlush(micros);
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("telemetry flush failed: {}", ex.what());
    return false;
  }
  return ok;
}

void OtelTelemetryService::Shutdown() noexcept {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
  }

  // Let initialization (and the drain) run to completion first
  if (init_thread_.joinable()) {
    try {
      init_thread_.join();
    } catch (const std::exception& ex) {
      EC_LOG_WARN_FMT("telemetry init thread join failed: {}", ex.what());
    }
  }

  std::shared_ptr<Backend> backend;
  {
    std::lock_guard<std::mutex> lock(mu_);
    backend = backend_;
  }
  if (!backend) {
    return;
  }

  try {
    // ----------------------------------------------------------
    // Logs (flush first)
    // ----------------------------------------------------------
    backend->logger_provider->ForceFlush();
    if (!backend->logger_provider->Shutdown()) {
      EC_LOG_WARN_FMT("logger provider shutdown reported failure");
    }

    // ----------------------------------------------------------
    // Traces
    // ----------------------------------------------------------
    backend->tracer_provider->ForceFlush();
    if (!backend->tracer_provider->Shutdown()) {
      EC_LOG_WARN_FMT("tracer provider shutdown reported failure");
    }

    // ----------------------------------------------------------
    // Metrics (stop periodic readers last)
    // ----------------------------------------------------------
    backend->meter_provider->ForceFlush();
    if (!backend->meter_provider->Shutdown()) {
      EC_LOG_WARN_FMT("meter provider shutdown reported failure");
    }

    // Only clear globals that still point at this service's providers
    if (trace_api::Provider::GetTracerProvider().get() == backend->tracer_provider.get()) {
      std::shared_ptr<trace_api::TracerProvider> noop =
          std::make_shared<trace_api::NoopTracerProvider>();
      trace_api::Provider::SetTracerProvider(noop);
    }
    if (logs_api::Provider::GetLoggerProvider().get() == backend->logger_provider.get()) {
      std::shared_ptr<logs_api::LoggerProvider> noop =
          std::make_shared<logs_api::NoopLoggerProvider>();
      logs_api::Provider::SetLoggerProvider(noop);
    }
    if (metrics_api::Provider::GetMeterProvider().get() == backend->meter_provider.get()) {
      std::shared_ptr<metrics_api::MeterProvider> noop =
          std::make_shared<metrics_api::NoopMeterProvider>();
      metrics_api::Provider::SetMeterProvider(noop);
    }
  } catch (const std::exception& ex) {
    EC_LOG_WARN_FMT("telemetry shutdown failed: {}", ex.what());
  }
}

}  // namespace emitcore::telemetry
