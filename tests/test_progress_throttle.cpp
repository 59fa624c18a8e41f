#include <gtest/gtest.h>
#include <transfer/progress_throttle.hpp>

using namespace std::chrono;

TEST(ProgressThrottle, FirstSampleAlwaysPasses) {
    ProgressThrottle t(100, 1000);
    EXPECT_TRUE(t.should_emit(0, 5000, ProgressThrottle::Clock::time_point{}));
}

TEST(ProgressThrottle, SuppressesWithinIntervalAndStep) {
    ProgressThrottle t(100, 1000);
    auto t0 = ProgressThrottle::Clock::now();
    ASSERT_TRUE(t.should_emit(0, 5000, t0));
    EXPECT_FALSE(t.should_emit(10, 5000, t0 + milliseconds(10)));
    EXPECT_FALSE(t.should_emit(999, 5000, t0 + milliseconds(20)));
}

TEST(ProgressThrottle, EmitsOnByteStep) {
    ProgressThrottle t(100, 1000);
    auto t0 = ProgressThrottle::Clock::now();
    ASSERT_TRUE(t.should_emit(0, 5000, t0));
    EXPECT_TRUE(t.should_emit(1000, 5000, t0 + milliseconds(1)));
    EXPECT_FALSE(t.should_emit(1500, 5000, t0 + milliseconds(2)));
}

TEST(ProgressThrottle, EmitsOnInterval) {
    ProgressThrottle t(100, 1000000);
    auto t0 = ProgressThrottle::Clock::now();
    ASSERT_TRUE(t.should_emit(0, 5000, t0));
    EXPECT_TRUE(t.should_emit(1, 5000, t0 + milliseconds(100)));
}

TEST(ProgressThrottle, FinalSamplePassesExactlyOnce) {
    ProgressThrottle t(100, 1000000);
    auto t0 = ProgressThrottle::Clock::now();
    ASSERT_TRUE(t.should_emit(0, 5000, t0));
    EXPECT_TRUE(t.should_emit(5000, 5000, t0 + milliseconds(1)));
    EXPECT_FALSE(t.should_emit(5000, 5000, t0 + milliseconds(500)));
}

TEST(ProgressThrottle, EmptyTransferHasNoFinalSample) {
    ProgressThrottle t(100, 1000);
    auto t0 = ProgressThrottle::Clock::now();
    EXPECT_TRUE(t.should_emit(0, 0, t0));
    EXPECT_FALSE(t.should_emit(0, 0, t0 + milliseconds(1)));
}
