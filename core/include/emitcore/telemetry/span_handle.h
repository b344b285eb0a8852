#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include "emitcore/telemetry/attributes.h"

namespace emitcore::telemetry {

enum class SpanKind {
  Internal,
  Server,
  Client,
  Producer,
  Consumer,
};

enum class SpanStatusCode {
  Unset,
  Ok,
  Error,
};

struct SpanOptions {
  SpanKind kind = SpanKind::Internal;
  Attributes attributes;
};

// RAII token returned by SpanHandle::Activate(). While alive, the
// span is the active context and new spans on this thread become its
// children. Must be destroyed on the thread that created it.
class SpanScope {
 public:
  virtual ~SpanScope() = default;
};

/**
 * Backend-independent handle for one span.
 *
 * Implementations:
 *  - a no-op handle (telemetry disabled, failed, or buffer full)
 *  - a handle bound to a live SDK span
 *  - a buffered handle that records calls until it is bound
 *
 * No method ever throws. Calls made after End() are accepted and
 * ignored by the backend.
 */
class SpanHandle {
 public:
  virtual ~SpanHandle() = default;

  virtual void SetAttribute(std::string_view key, const AttributeValue& value) noexcept = 0;
  virtual void SetAttributes(const OptionalAttributes& attributes) noexcept = 0;
  virtual void SetStatus(SpanStatusCode code, std::string_view message = {}) noexcept = 0;

  // Records an "exception" event following OpenTelemetry semantic
  // conventions (exception.type, exception.message).
  virtual void RecordException(std::string_view type, std::string_view message) noexcept = 0;
  void RecordException(const std::exception& error) noexcept;
  void RecordException(std::exception_ptr error) noexcept;

  virtual void End() noexcept = 0;

  // Make this span the active context. Returns nullptr when the
  // handle has no live span to activate.
  virtual std::unique_ptr<SpanScope> Activate() noexcept {
    return nullptr;
  }
};

// Shared handle that discards everything.
std::shared_ptr<SpanHandle> NoopSpan();

// ------------------------------------------------------------
// ScopedSpanEnd
// ------------------------------------------------------------
// Ends the span exactly once: on End() or on destruction,
// whichever comes first.
//
class ScopedSpanEnd {
 public:
  explicit ScopedSpanEnd(std::shared_ptr<SpanHandle> span) : span_(std::move(span)) {}
  ~ScopedSpanEnd() {
    End();
  }

  ScopedSpanEnd(const ScopedSpanEnd&) = delete;
  ScopedSpanEnd& operator=(const ScopedSpanEnd&) = delete;

  void End() noexcept {
    if (auto span = std::move(span_)) {
      span->End();
    }
  }

 private:
  std::shared_ptr<SpanHandle> span_;
};

}  // namespace emitcore::telemetry
