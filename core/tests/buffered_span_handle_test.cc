#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "emitcore/telemetry/buffered_span_handle.h"

namespace emitcore::telemetry {
namespace {

// Span that records each call as a short string.
class RecordingSpan : public SpanHandle {
 public:
  using SpanHandle::RecordException;

  void SetAttribute(std::string_view key, const AttributeValue&) noexcept override {
    Record("attr:" + std::string(key));
  }
  void SetAttributes(const OptionalAttributes& attributes) noexcept override {
    for (const auto& [key, value] : attributes) {
      if (value) {
        Record("attr:" + key);
      }
    }
  }
  void SetStatus(SpanStatusCode code, std::string_view message) noexcept override {
    Record("status:" + std::to_string(static_cast<int>(code)) + ":" + std::string(message));
  }
  void RecordException(std::string_view type, std::string_view message) noexcept override {
    Record("exception:" + std::string(type) + ":" + std::string(message));
  }
  void End() noexcept override {
    Record("end");
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

 private:
  void Record(std::string call) {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(std::move(call));
  }

  mutable std::mutex mu_;
  std::vector<std::string> calls_;
};

}  // namespace

TEST(BufferedSpanHandleTest, ReplaysInOrderOnBind) {
  BufferedSpanHandle handle;
  handle.SetAttribute("a", int64_t{1});
  handle.SetStatus(SpanStatusCode::Error, "bad");
  handle.RecordException("std::runtime_error", "boom");
  handle.End();

  EXPECT_FALSE(handle.bound());
  EXPECT_EQ(handle.pending(), 4u);

  auto real = std::make_shared<RecordingSpan>();
  handle.Bind(real);

  EXPECT_TRUE(handle.bound());
  EXPECT_EQ(handle.pending(), 0u);
  EXPECT_EQ(real->calls(), (std::vector<std::string>{"attr:a", "status:2:bad",
                                                     "exception:std::runtime_error:boom",
                                                     "end"}));
}

TEST(BufferedSpanHandleTest, ForwardsAfterBind) {
  BufferedSpanHandle handle;
  auto real = std::make_shared<RecordingSpan>();
  handle.Bind(real);

  handle.SetAttributes({{"present", AttributeValue{true}}, {"absent", std::nullopt}});
  handle.End();

  EXPECT_EQ(real->calls(), (std::vector<std::string>{"attr:present", "end"}));
}

TEST(BufferedSpanHandleTest, CopiesArgumentsWhileBuffered) {
  BufferedSpanHandle handle;
  {
    std::string key = "temporary";
    std::string message = "short-lived";
    handle.SetAttribute(key, std::string("v"));
    handle.SetStatus(SpanStatusCode::Ok, message);
  }

  auto real = std::make_shared<RecordingSpan>();
  handle.Bind(real);
  EXPECT_EQ(real->calls(), (std::vector<std::string>{"attr:temporary", "status:1:short-lived"}));
}

TEST(BufferedSpanHandleTest, AbandonDropsEverything) {
  BufferedSpanHandle handle;
  handle.SetAttribute("a", int64_t{1});
  handle.Abandon();
  handle.End();

  EXPECT_EQ(handle.pending(), 0u);

  auto real = std::make_shared<RecordingSpan>();
  handle.Bind(real);

  EXPECT_FALSE(handle.bound());
  EXPECT_TRUE(real->calls().empty());
}

TEST(BufferedSpanHandleTest, BindNullAbandons) {
  BufferedSpanHandle handle;
  handle.End();
  handle.Bind(nullptr);

  EXPECT_FALSE(handle.bound());
  EXPECT_EQ(handle.pending(), 0u);
}

TEST(BufferedSpanHandleTest, FirstBindWins) {
  BufferedSpanHandle handle;
  auto first = std::make_shared<RecordingSpan>();
  auto second = std::make_shared<RecordingSpan>();

  handle.Bind(first);
  handle.Bind(second);
  handle.Abandon();
  handle.End();

  EXPECT_EQ(first->calls(), (std::vector<std::string>{"end"}));
  EXPECT_TRUE(second->calls().empty());
}

TEST(BufferedSpanHandleTest, ActivateIsNullUntilBound) {
  BufferedSpanHandle handle;
  EXPECT_EQ(handle.Activate(), nullptr);

  // RecordingSpan has no context to activate either
  handle.Bind(std::make_shared<RecordingSpan>());
  EXPECT_EQ(handle.Activate(), nullptr);
}

TEST(SpanHandleTest, RecordsStandardExceptions) {
  RecordingSpan span;
  span.RecordException(std::runtime_error("disk full"));

  auto calls = span.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0], "exception:std::runtime_error:disk full");
}

TEST(SpanHandleTest, RecordsExceptionPointers) {
  RecordingSpan span;
  span.RecordException(std::make_exception_ptr(42));
  span.RecordException(std::make_exception_ptr(std::logic_error("bad state")));
  span.RecordException(std::exception_ptr{});

  auto calls = span.calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], "exception:unknown:non-standard exception");
  EXPECT_EQ(calls[1], "exception:std::logic_error:bad state");
}

TEST(SpanHandleTest, ScopedSpanEndEndsOnce) {
  auto span = std::make_shared<RecordingSpan>();
  {
    ScopedSpanEnd guard(span);
    guard.End();
  }
  EXPECT_EQ(span->calls(), (std::vector<std::string>{"end"}));
}

TEST(SpanHandleTest, NoopSpanIsShared) {
  auto a = NoopSpan();
  auto b = NoopSpan();
  EXPECT_EQ(a, b);
  a->SetAttribute("k", int64_t{1});
  a->End();
}

}  // namespace emitcore::telemetry
