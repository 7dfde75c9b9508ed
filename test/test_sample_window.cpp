#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "data/SampleWindow.h"

namespace {

const uint64_t US_PER_S = 1000000ULL;

TelemetrySample sampleAt(uint64_t t_us, uint16_t tag) {
  TelemetrySample s;
  s.received_at_us = t_us;
  s.tof_average_raw = tag;
  return s;
}

}  // namespace

TEST(SampleWindow, KeepsOnlyTrailingRetentionWindow) {
  SampleWindow w(60);

  // One sample per second over 620 s
  for (uint16_t t = 0; t <= 620; t++) {
    w.append(sampleAt((uint64_t)t * US_PER_S, t));
  }

  const std::vector<TelemetrySample> snap = w.snapshot();
  ASSERT_EQ(snap.size(), 61u);   // 560 .. 620 inclusive
  EXPECT_EQ(snap.front().tof_average_raw, 560);
  EXPECT_EQ(snap.back().tof_average_raw, 620);

  for (size_t i = 1; i < snap.size(); i++) {
    EXPECT_LT(snap[i - 1].received_at_us, snap[i].received_at_us);
    EXPECT_GE(snap[i].received_at_us, 560 * US_PER_S);
  }
}

TEST(SampleWindow, RetentionIsClampedToLimits) {
  SampleWindow tiny(1);
  EXPECT_EQ(tiny.retentionSeconds(), RETENTION_MIN_S);

  SampleWindow w;
  EXPECT_EQ(w.retentionSeconds(), RETENTION_DEFAULT_S);
  EXPECT_EQ(w.setRetention(10000), RETENTION_MAX_S);
  EXPECT_EQ(w.setRetention(-3), RETENTION_MIN_S);
  EXPECT_EQ(w.setRetention(120), 120);
  EXPECT_EQ(w.retentionSeconds(), 120);
}

TEST(SampleWindow, ShrinkingRetentionEvictsImmediately) {
  SampleWindow w(600);
  for (uint16_t t = 0; t < 100; t++) {
    w.append(sampleAt((uint64_t)t * US_PER_S, t));
  }
  EXPECT_EQ(w.size(), 100u);

  w.setRetention(10);
  const std::vector<TelemetrySample> snap = w.snapshot();
  ASSERT_EQ(snap.size(), 11u);   // 89 .. 99
  EXPECT_EQ(snap.front().tof_average_raw, 89);

  // Growing again does not bring evicted samples back
  w.setRetention(600);
  EXPECT_EQ(w.size(), 11u);
}

TEST(SampleWindow, SampleExactlyAtCutoffIsKept) {
  SampleWindow w(5);
  w.append(sampleAt(10 * US_PER_S, 1));
  w.append(sampleAt(15 * US_PER_S, 2));
  EXPECT_EQ(w.size(), 2u);

  w.append(sampleAt(15 * US_PER_S + 1, 3));
  EXPECT_EQ(w.size(), 2u);
  EXPECT_EQ(w.snapshot().front().tof_average_raw, 2);
}

TEST(SampleWindow, TiesKeepArrivalOrder) {
  SampleWindow w;
  w.append(sampleAt(7 * US_PER_S, 1));
  w.append(sampleAt(7 * US_PER_S, 2));
  w.append(sampleAt(7 * US_PER_S, 3));

  const std::vector<TelemetrySample> snap = w.snapshot();
  ASSERT_EQ(snap.size(), 3u);
  EXPECT_EQ(snap[0].tof_average_raw, 1);
  EXPECT_EQ(snap[1].tof_average_raw, 2);
  EXPECT_EQ(snap[2].tof_average_raw, 3);
}

TEST(SampleWindow, SnapshotIsACopy) {
  SampleWindow w;
  w.append(sampleAt(1, 1));
  std::vector<TelemetrySample> snap = w.snapshot();
  w.append(sampleAt(2, 2));
  snap[0].tof_average_raw = 99;

  EXPECT_EQ(snap.size(), 1u);
  EXPECT_EQ(w.snapshot()[0].tof_average_raw, 1);
}

TEST(SampleWindow, LatestAndClear) {
  SampleWindow w;
  TelemetrySample s;
  EXPECT_FALSE(w.latest(s));

  w.append(sampleAt(1, 5));
  w.append(sampleAt(2, 6));
  ASSERT_TRUE(w.latest(s));
  EXPECT_EQ(s.tof_average_raw, 6);

  w.clear();
  EXPECT_EQ(w.size(), 0u);
  EXPECT_FALSE(w.latest(s));
  EXPECT_EQ(w.retentionSeconds(), RETENTION_DEFAULT_S);
}

// Every snapshot taken while a writer appends must be a contiguous run of
// the writer's sequence: no duplicates, no holes, oldest first.
TEST(SampleWindow, ConcurrentSnapshotsAreConsistent) {
  SampleWindow w(5);
  const uint32_t TOTAL = 20000;          // 1 ms apart -> 20 s, window keeps 5 s
  std::atomic<bool> done(false);
  std::atomic<uint32_t> bad(0);
  std::atomic<uint32_t> checked(0);

  std::thread writer([&]() {
    for (uint32_t i = 0; i < TOTAL; i++) {
      TelemetrySample s;
      s.received_at_us = (uint64_t)i * 1000ULL;
      s.tof_average_raw = (uint16_t)(i & 0xFFFF);
      w.append(s);
    }
    done.store(true);
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; r++) {
    readers.push_back(std::thread([&]() {
      while (!done.load()) {
        const std::vector<TelemetrySample> snap = w.snapshot();
        for (size_t i = 1; i < snap.size(); i++) {
          if (snap[i].received_at_us != snap[i - 1].received_at_us + 1000ULL) {
            bad.fetch_add(1);
          }
        }
        if (!snap.empty() &&
            snap.back().received_at_us - snap.front().received_at_us > 5 * US_PER_S) {
          bad.fetch_add(1);
        }
        checked.fetch_add(1);
      }
    }));
  }

  writer.join();
  for (size_t i = 0; i < readers.size(); i++) readers[i].join();

  EXPECT_EQ(bad.load(), 0u);

  // Single-threaded reference: last 5 s of a 1 ms cadence
  const std::vector<TelemetrySample> final_snap = w.snapshot();
  ASSERT_EQ(final_snap.size(), 5001u);
  EXPECT_EQ(final_snap.back().received_at_us, (uint64_t)(TOTAL - 1) * 1000ULL);
}
