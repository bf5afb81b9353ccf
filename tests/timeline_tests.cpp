#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <vector>

#include "core/timeline.hpp"
#include "tests/harness/replay_fakes.hpp"

namespace {

using test::log_time;
using test::ManualClock;

constexpr double kEps = 1e-6;

double sleep_s(core::Timeline& tl, double log_seconds) {
    return tl.next_sleep(log_time(log_seconds)).count();
}

// Timeline_FirstEventIsDueImmediately - the first event anchors both clocks
TEST(TimelineTest, FirstEventIsDueImmediately) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);

    EXPECT_NEAR(sleep_s(tl, 100.0), 0.0, kEps);
    ASSERT_TRUE(tl.state().log_origin.has_value());
    EXPECT_EQ(*tl.state().log_origin, log_time(100.0));
    ASSERT_TRUE(tl.state().replay_start.has_value());
    EXPECT_EQ(*tl.state().replay_start, clock.now());
}

// Timeline_RealTimeGapAtSpeedOne - log gaps map 1:1 onto sleeps
TEST(TimelineTest, RealTimeGapAtSpeedOne) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);

    EXPECT_NEAR(sleep_s(tl, 0.0), 0.0, kEps);
    EXPECT_NEAR(sleep_s(tl, 5.0), 5.0, kEps);
    clock.advance(std::chrono::seconds(5));
    EXPECT_NEAR(sleep_s(tl, 10.0), 5.0, kEps);
}

// Timeline_SpeedMultiplierCompressesSleep - 2x replays a 10s gap in 5s
TEST(TimelineTest, SpeedMultiplierCompressesSleep) {
    ManualClock clock;
    core::Timeline tl(2.0, clock);

    (void)sleep_s(tl, 0.0);
    EXPECT_NEAR(sleep_s(tl, 10.0), 5.0, kEps);

    clock.advance(std::chrono::seconds(5));
    EXPECT_NEAR(sleep_s(tl, 20.0), 5.0, kEps);
}

// Timeline_SpeedBelowOneStretchesSleep - 0.5x doubles every gap
TEST(TimelineTest, SpeedBelowOneStretchesSleep) {
    ManualClock clock;
    core::Timeline tl(0.5, clock);

    (void)sleep_s(tl, 0.0);
    EXPECT_NEAR(sleep_s(tl, 3.0), 6.0, kEps);
}

// Timeline_ElapsedRealTimeIsSubtracted - time spent elsewhere shortens the sleep
TEST(TimelineTest, ElapsedRealTimeIsSubtracted) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);

    (void)sleep_s(tl, 0.0);
    clock.advance(std::chrono::seconds(3));
    EXPECT_NEAR(sleep_s(tl, 5.0), 2.0, kEps);
}

// Timeline_BehindScheduleIsNegative - lag is reported, not clamped
TEST(TimelineTest, BehindScheduleIsNegative) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);
    (void)sleep_s(tl, 0.0);
    clock.advance(std::chrono::seconds(8));
    EXPECT_NEAR(sleep_s(tl, 5.0), -3.0, kEps);

    ManualClock fast_clock;
    core::Timeline fast(2.0, fast_clock);
    (void)sleep_s(fast, 0.0);
    fast_clock.advance(std::chrono::seconds(4)); // 8s of log time at 2x
    EXPECT_NEAR(sleep_s(fast, 5.0), -1.5, kEps);
}

// Timeline_ReplayStartSetOnce - later events and cycles never move replay_start
TEST(TimelineTest, ReplayStartSetOnce) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);
    (void)sleep_s(tl, 0.0);
    const auto start = *tl.state().replay_start;

    clock.advance(std::chrono::seconds(2));
    (void)sleep_s(tl, 2.0);
    tl.begin_cycle();
    clock.advance(std::chrono::seconds(1));
    (void)sleep_s(tl, 0.0);

    EXPECT_EQ(*tl.state().replay_start, start);
}

// Timeline_BeginCycleBeforeFirstEventDoesNotShift - an initial begin_cycle is harmless
TEST(TimelineTest, BeginCycleBeforeFirstEventDoesNotShift) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);
    tl.begin_cycle();

    EXPECT_NEAR(sleep_s(tl, 7.0), 0.0, kEps);
    EXPECT_EQ(*tl.state().log_origin, log_time(7.0));
    EXPECT_FALSE(tl.state().log_duration.has_value());
    EXPECT_EQ(tl.state().cycles_started, 1u);
}

// Timeline_LogDurationLearnedAtSecondCycle - duration = last - first of pass one
TEST(TimelineTest, LogDurationLearnedAtSecondCycle) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);
    (void)sleep_s(tl, 0.0);
    (void)sleep_s(tl, 5.0);
    (void)sleep_s(tl, 10.0);
    EXPECT_FALSE(tl.state().log_duration.has_value());

    tl.begin_cycle();
    (void)sleep_s(tl, 0.0);

    ASSERT_TRUE(tl.state().log_duration.has_value());
    EXPECT_EQ(*tl.state().log_duration, std::chrono::seconds(10));
    EXPECT_EQ(*tl.state().log_origin, log_time(-10.0));
    EXPECT_EQ(tl.state().cycles_started, 2u);

    tl.begin_cycle();
    (void)sleep_s(tl, 0.0);
    EXPECT_EQ(*tl.state().log_duration, std::chrono::seconds(10));
    EXPECT_EQ(*tl.state().log_origin, log_time(-20.0));
    EXPECT_EQ(tl.state().cycles_started, 3u);
}

// Timeline_WrapMatchesLinearContinuation - cycling gives the same sleeps as an unrolled log
TEST(TimelineTest, WrapMatchesLinearContinuation) {
    const std::vector<double> pass{0.0, 4.0, 10.0};
    const double duration = pass.back() - pass.front();

    ManualClock cyc_clock;
    ManualClock lin_clock;
    core::Timeline cyclic(1.5, cyc_clock);
    core::Timeline linear(1.5, lin_clock);

    for (int cycle = 0; cycle < 3; ++cycle) {
        if (cycle > 0) {
            cyclic.begin_cycle();
        }
        for (double t : pass) {
            const double cyc = sleep_s(cyclic, t);
            const double lin = sleep_s(linear, t + cycle * duration);
            EXPECT_NEAR(cyc, lin, kEps) << "cycle " << cycle << " t=" << t;
            cyc_clock.advance(std::chrono::milliseconds(1700));
            lin_clock.advance(std::chrono::milliseconds(1700));
        }
    }
}

// Timeline_FirstEventOfSecondCycleNoJump - the wrap does not reset to the start of real time
TEST(TimelineTest, FirstEventOfSecondCycleNoJump) {
    ManualClock clock;
    core::Timeline tl(1.0, clock);
    (void)sleep_s(tl, 0.0);
    clock.advance(std::chrono::seconds(5));
    (void)sleep_s(tl, 5.0);
    clock.advance(std::chrono::seconds(5));
    (void)sleep_s(tl, 10.0);
    clock.advance(std::chrono::seconds(1));

    tl.begin_cycle();
    // Log position 10s, real position 11s: 1s behind rather than 11s behind.
    EXPECT_NEAR(sleep_s(tl, 0.0), -1.0, kEps);
}

// Timeline_RejectsNonPositiveSpeed - constructor validation
TEST(TimelineTest, RejectsNonPositiveSpeed) {
    ManualClock clock;
    EXPECT_THROW(core::Timeline(0.0, clock), std::invalid_argument);
    EXPECT_THROW(core::Timeline(-1.0, clock), std::invalid_argument);
    EXPECT_THROW(core::Timeline(std::numeric_limits<double>::quiet_NaN(), clock), std::invalid_argument);
    EXPECT_NO_THROW(core::Timeline(0.01, clock));
}

} // namespace
