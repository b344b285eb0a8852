#include "emitcore/telemetry/operation_buffer.h"

#include <algorithm>

#include "emitcore/observability/logging.h"

namespace emitcore::telemetry {

bool OperationBuffer::TryPush(BufferedOperation op) {
  if (ops_.size() >= capacity_) {
    return false;
  }
  ops_.push_back(std::move(op));
  return true;
}

std::vector<BufferedOperation> OperationBuffer::TakeChunk(std::size_t max) {
  std::vector<BufferedOperation> chunk;
  chunk.reserve(std::min(max, ops_.size()));

  while (!ops_.empty() && chunk.size() < max) {
    chunk.push_back(std::move(ops_.front()));
    ops_.pop_front();
  }
  return chunk;
}

std::size_t OperationBuffer::Discard() noexcept {
  std::deque<BufferedOperation> dropped;
  dropped.swap(ops_);

  for (auto& op : dropped) {
    if (!op.discard) {
      continue;
    }
    try {
      op.discard();
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("discard hook failed: {}", ex.what());
    } catch (...) {
      EC_LOG_DEBUG_FMT("discard hook failed: unknown error");
    }
  }
  return dropped.size();
}

std::size_t ReplayChunk(std::vector<BufferedOperation>& chunk) noexcept {
  std::size_t replayed = 0;
  for (auto& op : chunk) {
    try {
      op.replay();
      ++replayed;
    } catch (const std::exception& ex) {
      EC_LOG_DEBUG_FMT("buffered operation failed during replay: {}", ex.what());
    } catch (...) {
      EC_LOG_DEBUG_FMT("buffered operation failed during replay: unknown error");
    }
  }
  return replayed;
}

}  // namespace emitcore::telemetry
