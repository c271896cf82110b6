#include <gtest/gtest.h>
#include <vector>
#include "transfer/progress_tracker.hpp"

using namespace netfs;
using namespace netfs::transfer;

TEST(ProgressTrackerTest, ReportsOncePerStep) {
  std::vector<uint64_t> reported;
  ProgressTracker tracker([&reported](const TransferProgress& p) {
    reported.push_back(p.bytes_transferred);
    return true;
  }, 1024 * 1024);

  // 64 KB chunks over 1 MB
  for (uint64_t sent = 64 * 1024; sent <= 1024 * 1024; sent += 64 * 1024) {
    ASSERT_TRUE(tracker.update(sent));
  }
  ASSERT_TRUE(tracker.finish());

  ASSERT_FALSE(reported.empty());
  EXPECT_LE(reported.size(), 11u);
  EXPECT_EQ(reported.back(), 1024u * 1024u);
  for (std::size_t i = 1; i + 1 < reported.size(); ++i) {
    EXPECT_GE(reported[i] - reported[i - 1], ProgressTracker::DEFAULT_STEP_BYTES);
  }
}

TEST(ProgressTrackerTest, SmallTransferStillReportsOnFinish) {
  int calls = 0;
  TransferProgress last;
  ProgressTracker tracker([&](const TransferProgress& p) {
    ++calls;
    last = p;
    return true;
  }, 500);

  EXPECT_TRUE(tracker.update(200));
  EXPECT_TRUE(tracker.update(500));
  EXPECT_EQ(calls, 0);

  EXPECT_TRUE(tracker.finish());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(last.bytes_transferred, 500u);
  EXPECT_EQ(last.total_bytes, 500u);

  // Nothing new since the last report
  EXPECT_TRUE(tracker.finish());
  EXPECT_EQ(calls, 1);
}

TEST(ProgressTrackerTest, CallbackCancels) {
  int calls = 0;
  ProgressTracker tracker([&calls](const TransferProgress&) {
    ++calls;
    return false;
  }, 0, 10);

  EXPECT_TRUE(tracker.update(5));
  EXPECT_FALSE(tracker.update(20));
  EXPECT_TRUE(tracker.cancelled());
  EXPECT_FALSE(tracker.update(40));
  EXPECT_FALSE(tracker.finish());
  EXPECT_EQ(calls, 1);
}

TEST(ProgressTrackerTest, ChunkCallbackAddsBase) {
  std::vector<uint64_t> reported;
  ProgressTracker tracker([&reported](const TransferProgress& p) {
    reported.push_back(p.bytes_transferred);
    return true;
  }, 2000, 100);

  auto first_leg = tracker.chunk_callback();
  auto second_leg = tracker.chunk_callback(1000);
  EXPECT_TRUE(first_leg(1000));
  EXPECT_TRUE(second_leg(1000));

  ASSERT_EQ(reported.size(), 2u);
  EXPECT_EQ(reported[0], 1000u);
  EXPECT_EQ(reported[1], 2000u);
  EXPECT_EQ(tracker.bytes_transferred(), 2000u);
  EXPECT_EQ(tracker.report_count(), 2u);
}

TEST(ProgressTrackerTest, NoCallbackNeverCancels) {
  ProgressTracker tracker(nullptr, 100, 10);
  EXPECT_TRUE(tracker.update(50));
  EXPECT_TRUE(tracker.finish());
  EXPECT_FALSE(tracker.cancelled());
}
