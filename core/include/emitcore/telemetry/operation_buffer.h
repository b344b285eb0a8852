#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

namespace emitcore::telemetry {

// A call recorded before the backend was ready.
//
// `replay` runs at most once, after initialization succeeds.
// `discard` (optional) runs instead when initialization fails.
struct BufferedOperation {
  std::function<void()> replay;
  std::function<void()> discard;
};

// ------------------------------------------------------------
// OperationBuffer
// ------------------------------------------------------------
// Bounded FIFO of pending operations. Not synchronized: the
// owning service guards it with its own mutex.
//
class OperationBuffer {
 public:
  explicit OperationBuffer(std::size_t capacity) : capacity_(capacity) {}

  // Append `op`. Returns false (and drops `op`) when full.
  bool TryPush(BufferedOperation op);

  // Remove up to `max` operations from the front, in order.
  std::vector<BufferedOperation> TakeChunk(std::size_t max);

  // Remove every pending operation and run its discard hook.
  // Returns the number of operations dropped.
  std::size_t Discard() noexcept;

  std::size_t size() const {
    return ops_.size();
  }
  bool empty() const {
    return ops_.empty();
  }
  std::size_t capacity() const {
    return capacity_;
  }

 private:
  std::size_t capacity_;
  std::deque<BufferedOperation> ops_;
};

// Run every replay hook in order. A hook that throws is logged and
// skipped. Returns the number of hooks that completed.
std::size_t ReplayChunk(std::vector<BufferedOperation>& chunk) noexcept;

}  // namespace emitcore::telemetry
