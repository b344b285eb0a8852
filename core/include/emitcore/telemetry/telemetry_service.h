#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

#include "emitcore/config/configuration.h"
#include "emitcore/telemetry/attributes.h"
#include "emitcore/telemetry/span_handle.h"

namespace emitcore::exporters {
class ExporterFactory;
}

namespace emitcore::telemetry {

// Pending calls kept while the backend initializes.
inline constexpr std::size_t kMaxBufferedOperations = 1000;

// Pending calls replayed per drain step.
inline constexpr std::size_t kDrainChunkSize = 50;

enum class InitState {
  Uninitialized,
  Initializing,
  Ready,
  Failed,
};

std::string_view ToString(InitState state) noexcept;

namespace detail {
template <typename T>
struct IsFuture : std::false_type {};
template <typename T>
struct IsFuture<std::future<T>> : std::true_type {};
}  // namespace detail

/**
 * Emission interface used by instrumented code.
 *
 * Every call returns immediately and never throws, whatever the
 * state of the backend. Implementations:
 *  - NoopTelemetryService: discards everything
 *  - OtelTelemetryService: OpenTelemetry SDK backend
 *
 * Pick one with CreateTelemetryService().
 */
class TelemetryService {
 public:
  virtual ~TelemetryService() = default;

  // ----------------------------------------------------------
  // Spans
  // ----------------------------------------------------------
  virtual std::shared_ptr<SpanHandle> StartSpan(std::string_view name,
                                                const SpanOptions& options) noexcept = 0;

  std::shared_ptr<SpanHandle> StartSpan(std::string_view name) noexcept {
    return StartSpan(name, SpanOptions{});
  }

  // Start a span, run `fn(span)` with it active, and end it exactly
  // once on every exit path. Exceptions thrown by `fn` propagate.
  //
  // When `fn` returns std::future<T>, the result is a deferred
  // future that waits on it and ends the span once it completes,
  // or when the returned future is destroyed without being waited on.
  template <typename Fn>
  auto StartActiveSpan(std::string_view name, const SpanOptions& options, Fn&& fn)
      -> std::invoke_result_t<Fn&, SpanHandle&>;

  template <typename Fn>
  auto StartActiveSpan(std::string_view name, Fn&& fn) -> std::invoke_result_t<Fn&, SpanHandle&> {
    return StartActiveSpan(name, SpanOptions{}, std::forward<Fn>(fn));
  }

  // ----------------------------------------------------------
  // Metrics
  // ----------------------------------------------------------
  // Histogram record.
  virtual void RecordMetric(std::string_view name, double value,
                            const Attributes& attributes) noexcept = 0;
  virtual void IncrementCounter(std::string_view name, double value,
                                const Attributes& attributes) noexcept = 0;

  void RecordMetric(std::string_view name, double value) noexcept {
    RecordMetric(name, value, Attributes{});
  }
  void IncrementCounter(std::string_view name, double value = 1.0) noexcept {
    IncrementCounter(name, value, Attributes{});
  }

  // ----------------------------------------------------------
  // Logs
  // ----------------------------------------------------------
  virtual void EmitLogRecord(std::string_view body, const Attributes& attributes) noexcept = 0;

  void EmitLogRecord(std::string_view body) noexcept {
    EmitLogRecord(body, Attributes{});
  }

  // ----------------------------------------------------------
  // Lifecycle
  // ----------------------------------------------------------
  // Push pending batches to the exporters. Returns false when a
  // pipeline did not finish within `timeout`.
  virtual bool Flush(std::chrono::milliseconds timeout) noexcept = 0;

  // Flush, then release the backend. Idempotent.
  virtual void Shutdown() noexcept = 0;

  virtual const config::Configuration& config() const noexcept = 0;
  virtual InitState state() const noexcept = 0;
};

// ------------------------------------------------------------
// NoopTelemetryService
// ------------------------------------------------------------
class NoopTelemetryService final : public TelemetryService {
 public:
  explicit NoopTelemetryService(config::Configuration config) : config_(std::move(config)) {}

  using TelemetryService::EmitLogRecord;
  using TelemetryService::IncrementCounter;
  using TelemetryService::RecordMetric;
  using TelemetryService::StartSpan;

  std::shared_ptr<SpanHandle> StartSpan(std::string_view, const SpanOptions&) noexcept override {
    return NoopSpan();
  }
  void RecordMetric(std::string_view, double, const Attributes&) noexcept override {}
  void IncrementCounter(std::string_view, double, const Attributes&) noexcept override {}
  void EmitLogRecord(std::string_view, const Attributes&) noexcept override {}

  bool Flush(std::chrono::milliseconds) noexcept override {
    return true;
  }
  void Shutdown() noexcept override {}

  const config::Configuration& config() const noexcept override {
    return config_;
  }
  InitState state() const noexcept override {
    return InitState::Uninitialized;
  }

 private:
  const config::Configuration config_;
};

// ------------------------------------------------------------
// CreateTelemetryService
// ------------------------------------------------------------
// Selects the implementation once: OtelTelemetryService when
// `config.enabled`, NoopTelemetryService otherwise. `factory`
// is only used (and must outlive the service) when enabled;
// nullptr selects DefaultExporterFactory.
//
std::unique_ptr<TelemetryService> CreateTelemetryService(
    config::Configuration config, std::shared_ptr<exporters::ExporterFactory> factory = nullptr);

// ------------------------------------------------------------
// StartActiveSpan
// ------------------------------------------------------------
template <typename Fn>
auto TelemetryService::StartActiveSpan(std::string_view name, const SpanOptions& options, Fn&& fn)
    -> std::invoke_result_t<Fn&, SpanHandle&> {
  using Result = std::invoke_result_t<Fn&, SpanHandle&>;

  std::shared_ptr<SpanHandle> span = StartSpan(name, options);

  if constexpr (detail::IsFuture<Result>::value) {
    auto end = std::make_unique<ScopedSpanEnd>(span);

    Result inner;
    {
      auto scope = span->Activate();
      inner = std::invoke(fn, *span);
    }

    if (!inner.valid()) {
      end->End();
      return inner;
    }

    return std::async(std::launch::deferred,
                      [inner = std::move(inner), end = std::move(end)]() mutable {
                        // Released on return: the span ends after the inner
                        // future has produced its value or exception.
                        std::unique_ptr<ScopedSpanEnd> owner = std::move(end);
                        return inner.get();
                      });
  } else {
    ScopedSpanEnd end(span);
    auto scope = span->Activate();
    return std::invoke(fn, *span);
  }
}

}  // namespace emitcore::telemetry
