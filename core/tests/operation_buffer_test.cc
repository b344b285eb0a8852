#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "emitcore/telemetry/operation_buffer.h"

namespace emitcore::telemetry {

TEST(OperationBufferTest, PreservesOrderAcrossChunks) {
  OperationBuffer buffer(10);
  std::vector<int> seen;

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(buffer.TryPush({[&seen, i] { seen.push_back(i); }, nullptr}));
  }

  auto first = buffer.TakeChunk(2);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(buffer.size(), 3u);

  auto rest = buffer.TakeChunk(50);
  ASSERT_EQ(rest.size(), 3u);
  EXPECT_TRUE(buffer.empty());

  for (auto& op : first) {
    op.replay();
  }
  for (auto& op : rest) {
    op.replay();
  }
  EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(OperationBufferTest, RejectsBeyondCapacity) {
  OperationBuffer buffer(3);
  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(buffer.TryPush({[] {}, nullptr}));
  }
  EXPECT_FALSE(buffer.TryPush({[] {}, nullptr}));
  EXPECT_EQ(buffer.size(), 3u);
  EXPECT_EQ(buffer.capacity(), 3u);

  // Space frees up once drained
  buffer.TakeChunk(1);
  EXPECT_TRUE(buffer.TryPush({[] {}, nullptr}));
}

TEST(OperationBufferTest, DiscardRunsHooksNotReplays) {
  OperationBuffer buffer(10);
  int replayed = 0;
  int discarded = 0;

  buffer.TryPush({[&] { ++replayed; }, [&] { ++discarded; }});
  buffer.TryPush({[&] { ++replayed; }, nullptr});
  buffer.TryPush({[&] { ++replayed; }, [&] { ++discarded; }});

  EXPECT_EQ(buffer.Discard(), 3u);
  EXPECT_EQ(replayed, 0);
  EXPECT_EQ(discarded, 2);
  EXPECT_TRUE(buffer.empty());
}

TEST(OperationBufferTest, DiscardSurvivesThrowingHook) {
  OperationBuffer buffer(10);
  int discarded = 0;

  buffer.TryPush({[] {}, [] { throw std::runtime_error("boom"); }});
  buffer.TryPush({[] {}, [&] { ++discarded; }});

  EXPECT_EQ(buffer.Discard(), 2u);
  EXPECT_EQ(discarded, 1);
}

TEST(OperationBufferTest, DiscardSurvivesNonStandardThrow) {
  OperationBuffer buffer(10);
  int discarded = 0;

  buffer.TryPush({[] {}, [] { throw 42; }});
  buffer.TryPush({[] {}, [&] { ++discarded; }});

  EXPECT_EQ(buffer.Discard(), 2u);
  EXPECT_EQ(discarded, 1);
}

TEST(ReplayChunkTest, ThrowingOperationDoesNotStopTheRest) {
  OperationBuffer buffer(10);
  std::vector<int> seen;

  buffer.TryPush({[&] { seen.push_back(0); }, nullptr});
  buffer.TryPush({[] { throw std::runtime_error("bad replay"); }, nullptr});
  buffer.TryPush({[&] { seen.push_back(2); }, nullptr});
  buffer.TryPush({[] { throw 7; }, nullptr});
  buffer.TryPush({[&] { seen.push_back(4); }, nullptr});

  auto chunk = buffer.TakeChunk(50);
  EXPECT_EQ(ReplayChunk(chunk), 3u);
  EXPECT_EQ(seen, (std::vector<int>{0, 2, 4}));
}

}  // namespace emitcore::telemetry
