#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "emitcore/telemetry/span_handle.h"

namespace emitcore::telemetry {

/**
 * Span handle usable before the backend exists.
 *
 * States:
 *  - unbound: calls are recorded in order
 *  - bound:   Bind() replayed the recording onto the real span;
 *             every later call forwards directly
 *  - abandoned: Abandon() dropped the recording; every later call
 *             is discarded
 *
 * Bind() and Abandon() take effect at most once; whichever comes
 * first wins. Safe to use from several threads.
 */
class BufferedSpanHandle final : public SpanHandle {
 public:
  BufferedSpanHandle() = default;

  BufferedSpanHandle(const BufferedSpanHandle&) = delete;
  BufferedSpanHandle& operator=(const BufferedSpanHandle&) = delete;

  using SpanHandle::RecordException;

  void SetAttribute(std::string_view key, const AttributeValue& value) noexcept override;
  void SetAttributes(const OptionalAttributes& attributes) noexcept override;
  void SetStatus(SpanStatusCode code, std::string_view message) noexcept override;
  void RecordException(std::string_view type, std::string_view message) noexcept override;
  void End() noexcept override;
  std::unique_ptr<SpanScope> Activate() noexcept override;

  // Replay recorded calls onto `real`, then forward to it.
  void Bind(std::shared_ptr<SpanHandle> real) noexcept;

  // Drop recorded calls and become a no-op.
  void Abandon() noexcept;

  bool bound() const;
  std::size_t pending() const;

 private:
  using Operation = std::function<void(SpanHandle&)>;

  // Runs `op` on the real span if bound, records it if unbound,
  // drops it if abandoned.
  void Apply(Operation op) noexcept;

  mutable std::mutex mu_;
  std::vector<Operation> ops_;
  std::shared_ptr<SpanHandle> real_;
  bool abandoned_ = false;
};

}  // namespace emitcore::telemetry
