#include "emitcore/telemetry/buffered_span_handle.h"

#include <string>

#include "emitcore/observability/logging.h"

namespace emitcore::telemetry {

void BufferedSpanHandle::Apply(Operation op) noexcept {
  std::lock_guard<std::mutex> lock(mu_);

  if (abandoned_) {
    return;
  }

  if (!real_) {
    try {
      ops_.push_back(std::move(op));
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("buffered span: dropping call ({})", ex.what());
    }
    return;
  }

  try {
    op(*real_);
  } catch (const std::exception& ex) {
    EC_LOG_DEBUG_FMT("buffered span: forwarded call failed ({})", ex.what());
  }
}

// ------------------------------------------------------------
// SpanHandle
// ------------------------------------------------------------
void BufferedSpanHandle::SetAttribute(std::string_view key, const AttributeValue& value) noexcept {
  Apply([key = std::string(key), value](SpanHandle& span) { span.SetAttribute(key, value); });
}

void BufferedSpanHandle::SetAttributes(const OptionalAttributes& attributes) noexcept {
  Apply([attributes](SpanHandle& span) { span.SetAttributes(attributes); });
}

void BufferedSpanHandle::SetStatus(SpanStatusCode code, std::string_view message) noexcept {
  Apply([code, message = std::string(message)](SpanHandle& span) { span.SetStatus(code, message); });
}

void BufferedSpanHandle::RecordException(std::string_view type,
                                         std::string_view message) noexcept {
  Apply([type = std::string(type), message = std::string(message)](SpanHandle& span) {
    span.RecordException(type, message);
  });
}

void BufferedSpanHandle::End() noexcept {
  Apply([](SpanHandle& span) { span.End(); });
}

std::unique_ptr<SpanScope> BufferedSpanHandle::Activate() noexcept {
  std::shared_ptr<SpanHandle> real;
  {
    std::lock_guard<std::mutex> lock(mu_);
    real = real_;
  }
  // Nothing to activate until the real span exists.
  return real ? real->Activate() : nullptr;
}

// ------------------------------------------------------------
// Bind / Abandon
// ------------------------------------------------------------
void BufferedSpanHandle::Bind(std::shared_ptr<SpanHandle> real) noexcept {
  if (!real) {
    Abandon();
    return;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (abandoned_ || real_) {
    return;
  }

  // Replay under the lock so calls racing with Bind() queue up
  // behind the recording instead of overtaking it.
  for (auto& op : ops_) {
    try {
      op(*real);
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("buffered span: replayed call failed ({})", ex.what());
    }
  }
  ops_.clear();
  real_ = std::move(real);
}

void BufferedSpanHandle::Abandon() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  if (real_) {
    return;
  }
  abandoned_ = true;
  ops_.clear();
}

bool BufferedSpanHandle::bound() const {
  std::lock_guard<std::mutex> lock(mu_);
  return real_ != nullptr;
}

std::size_t BufferedSpanHandle::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ops_.size();
}

}  // namespace emitcore::telemetry
