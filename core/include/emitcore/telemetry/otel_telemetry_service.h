#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "emitcore/config/configuration.h"
#include "emitcore/exporters/exporter_factory.h"
#include "emitcore/telemetry/operation_buffer.h"
#include "emitcore/telemetry/telemetry_service.h"

namespace emitcore::telemetry {

/**
 * TelemetryService backed by the OpenTelemetry SDK.
 *
 * Lifecycle:
 *  - the constructor starts one background initialization thread
 *  - Initializing: calls are recorded in a bounded buffer
 *    (kMaxBufferedOperations); overflow is dropped
 *  - the thread builds exporters and providers, then replays the
 *    buffer in call order, kDrainChunkSize calls at a time
 *  - Ready: calls go straight to the SDK
 *  - Failed: the buffer is discarded and every call is a no-op
 *
 * Public calls never block on initialization and never throw.
 */
class OtelTelemetryService final : public TelemetryService {
 public:
  OtelTelemetryService(config::Configuration config,
                       std::shared_ptr<exporters::ExporterFactory> factory);
  ~OtelTelemetryService() override;

  OtelTelemetryService(const OtelTelemetryService&) = delete;
  OtelTelemetryService& operator=(const OtelTelemetryService&) = delete;

  using TelemetryService::EmitLogRecord;
  using TelemetryService::IncrementCounter;
  using TelemetryService::RecordMetric;
  using TelemetryService::StartSpan;

  std::shared_ptr<SpanHandle> StartSpan(std::string_view name,
                                        const SpanOptions& options) noexcept override;

  void RecordMetric(std::string_view name, double value,
                    const Attributes& attributes) noexcept override;
  void IncrementCounter(std::string_view name, double value,
                        const Attributes& attributes) noexcept override;

  void EmitLogRecord(std::string_view body, const Attributes& attributes) noexcept override;

  bool Flush(std::chrono::milliseconds timeout) noexcept override;
  void Shutdown() noexcept override;

  const config::Configuration& config() const noexcept override {
    return config_;
  }
  InitState state() const noexcept override;

  // Block until initialization settled (Ready or Failed).
  // Returns false on timeout.
  bool WaitForInitialization(std::chrono::milliseconds timeout) const;

  // Calls waiting in the pre-initialization buffer.
  std::size_t pending_operations() const;

 private:
  struct Backend;

  enum class InstrumentKind {
    Histogram,
    Counter,
  };

  // Outcome of routing a call through the state machine.
  enum class Route {
    Apply,     // Ready: run it now
    Buffered,  // Initializing: recorded for replay
    Dropped,   // Failed, shut down, or buffer full
  };

  template <typename MakeOp>
  Route RouteCall(MakeOp&& make_op);

  // ----------------------------------------------------------
  // Initialization thread
  // ----------------------------------------------------------
  void Initialize() noexcept;
  std::shared_ptr<Backend> BuildBackend();
  void Drain();
  void Fail(const std::string& reason) noexcept;

  // ----------------------------------------------------------
  // Direct application (Ready, or replay during drain)
  // ----------------------------------------------------------
  std::shared_ptr<SpanHandle> CreateSpan(const std::string& name, const SpanOptions& options);
  void ApplyInstrument(InstrumentKind kind, const std::string& name, double value,
                       const Attributes& attributes);
  void ApplyLogRecord(const std::string& body, const Attributes& attributes);

  const config::Configuration config_;
  std::shared_ptr<exporters::ExporterFactory> factory_;

  mutable std::mutex mu_;
  mutable std::condition_variable settled_cv_;
  InitState state_ = InitState::Uninitialized;
  bool shutdown_ = false;
  OperationBuffer buffer_{kMaxBufferedOperations};

  // Written once by the initialization thread, before the drain.
  std::shared_ptr<Backend> backend_;

  std::thread init_thread_;
};

}  // namespace emitcore::telemetry
