#include "clock.hpp"
#include "logger.hpp"
#include "time_source.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace tsid;

TEST(MonotonicClockTest, FollowsAdvancingWallClock) {
    ManualTimeSource src(1000);
    MonotonicClock clock(src);

    auto a = clock.next_instant();
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.value(), 1000u);

    src.set(1500);
    auto b = clock.next_instant();
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(b.value(), 1500u);
    EXPECT_EQ(clock.last_issued(), 1500u);
}

TEST(MonotonicClockTest, FrozenClockStillIncreases) {
    ManualTimeSource src(1700000000000);
    MonotonicClock clock(src);

    Instant prev = 0;
    for (int i = 0; i < 1000; ++i) {
        auto v = clock.next_instant();
        ASSERT_TRUE(v.ok());
        EXPECT_GT(v.value(), prev);
        prev = v.value();
    }
    // Ran ahead of the frozen wall clock by one millisecond per call.
    EXPECT_EQ(prev, 1700000000000u + 999);
}

TEST(MonotonicClockTest, BackwardStepDoesNotRegress) {
    ManualTimeSource src(5000);
    MonotonicClock clock(src);

    ASSERT_EQ(clock.next_instant().value(), 5000u);
    src.set(4000);
    EXPECT_EQ(clock.next_instant().value(), 5001u);
    EXPECT_EQ(clock.next_instant().value(), 5002u);

    // Wall clock catches up and overtakes.
    src.set(6000);
    EXPECT_EQ(clock.next_instant().value(), 6000u);
}

TEST(MonotonicClockTest, NegativeReadingIsClockUnavailable) {
    ManualTimeSource src(-1);
    MonotonicClock clock(src);

    auto v = clock.next_instant();
    ASSERT_FALSE(v.ok());
    EXPECT_EQ(v.code(), Errc::clock_unavailable);
    EXPECT_EQ(clock.last_issued(), 0u);

    src.set(10);
    auto w = clock.next_instant();
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(w.value(), 10u);
}

TEST(MonotonicClockTest, StartsAtZeroState) {
    ManualTimeSource src(0);
    MonotonicClock clock(src);
    EXPECT_EQ(clock.last_issued(), 0u);
    // A wall reading equal to the initial state still has to move forward.
    EXPECT_EQ(clock.next_instant().value(), 1u);
}

TEST(MonotonicClockTest, ResetRewindsState) {
    ManualTimeSource src(100);
    MonotonicClock clock(src);
    for (int i = 0; i < 10; ++i) ASSERT_TRUE(clock.next_instant().ok());
    EXPECT_EQ(clock.last_issued(), 109u);

    clock.reset();
    EXPECT_EQ(clock.last_issued(), 0u);
    EXPECT_EQ(clock.next_instant().value(), 100u);

    clock.reset(500);
    EXPECT_EQ(clock.next_instant().value(), 501u);
}

TEST(MonotonicClockTest, SystemClockTracksWallTime) {
    MonotonicClock clock(system_time_source());
    int64_t before = wall_ms();
    auto v = clock.next_instant();
    int64_t after = wall_ms();
    ASSERT_TRUE(v.ok());
    EXPECT_GE(static_cast<int64_t>(v.value()), before);
    EXPECT_LE(static_cast<int64_t>(v.value()), after + 1);
}

TEST(MonotonicClockTest, ConcurrentCallersNeverCollide) {
    ManualTimeSource src(1000);
    MonotonicClock clock(src);

    const int kThreads = 8;
    const int kPerThread = 5000;
    std::vector<std::vector<Instant>> got(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&clock, &got, t]{
            for (int i = 0; i < kPerThread; ++i) {
                auto v = clock.next_instant();
                if (v.ok()) got[t].push_back(v.value());
            }
        });
    }
    for (auto& th : threads) th.join();

    std::vector<Instant> all;
    for (const auto& seq : got) {
        ASSERT_EQ(seq.size(), static_cast<size_t>(kPerThread));
        EXPECT_TRUE(std::is_sorted(seq.begin(), seq.end()));
        EXPECT_EQ(std::adjacent_find(seq.begin(), seq.end()), seq.end());
        all.insert(all.end(), seq.begin(), seq.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
    // Frozen clock: the instants are exactly 1000 .. 1000 + n - 1.
    EXPECT_EQ(all.front(), 1000u);
    EXPECT_EQ(all.back(), 1000u + kThreads * kPerThread - 1);
}

TEST(MonotonicClockTest, LogsBackwardWallClock) {
    std::string path = ::testing::TempDir() + "tsid_clock_test.log";
    std::remove(path.c_str());
    {
        Logger logger(path, LogLevel::DEBUG);
        ManualTimeSource src(10000);
        MonotonicClock clock(src, &logger);
        ASSERT_TRUE(clock.next_instant().ok());
        src.set(7000);
        ASSERT_TRUE(clock.next_instant().ok());
    }
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("[WARN] wall clock moved backwards by 3000ms"), std::string::npos)
        << ss.str();
}
