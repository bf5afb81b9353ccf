#include <gtest/gtest.h>

#include <chrono>

#include "core/run_stats.hpp"

namespace {

// RunStats_OnScheduleHasNoLag - a positive last sleep means nothing is behind
TEST(RunStatsTest, OnScheduleHasNoLag) {
    const auto stats = core::assemble_run_stats(std::chrono::duration<double>(10.0), 50, 2, 0.25, 1);

    EXPECT_DOUBLE_EQ(stats.elapsed.count(), 10.0);
    EXPECT_EQ(stats.sent_count, 50u);
    EXPECT_DOUBLE_EQ(stats.average_requests_per_second, 5.0);
    EXPECT_EQ(stats.outstanding_count, 2u);
    EXPECT_DOUBLE_EQ(stats.seconds_behind, 0.0);
    EXPECT_DOUBLE_EQ(stats.percentage_behind, 0.0);
    EXPECT_EQ(stats.cycles, 1u);
}

// RunStats_NegativeSleepIsLag - lag is the negated last sleep over elapsed
TEST(RunStatsTest, NegativeSleepIsLag) {
    const auto stats = core::assemble_run_stats(std::chrono::duration<double>(20.0), 10, 0, -5.0, 3);

    EXPECT_DOUBLE_EQ(stats.seconds_behind, 5.0);
    EXPECT_DOUBLE_EQ(stats.percentage_behind, 0.25);
    EXPECT_DOUBLE_EQ(stats.average_requests_per_second, 0.5);
}

// RunStats_PercentageNotClamped - an overloaded target can exceed 1
TEST(RunStatsTest, PercentageNotClamped) {
    const auto stats = core::assemble_run_stats(std::chrono::duration<double>(2.0), 1, 0, -6.0, 1);
    EXPECT_DOUBLE_EQ(stats.percentage_behind, 3.0);
}

// RunStats_ZeroElapsedLeavesRatesAtZero - no division by zero
TEST(RunStatsTest, ZeroElapsedLeavesRatesAtZero) {
    const auto stats = core::assemble_run_stats(std::chrono::duration<double>(0.0), 0, 0, -1.0, 0);

    EXPECT_DOUBLE_EQ(stats.average_requests_per_second, 0.0);
    EXPECT_DOUBLE_EQ(stats.percentage_behind, 0.0);
    EXPECT_DOUBLE_EQ(stats.seconds_behind, 1.0);
}

// RunStats_JsonLayout - report keys and units
TEST(RunStatsTest, JsonLayout) {
    const auto stats = core::assemble_run_stats(std::chrono::duration<double>(90.0), 180, 4, -9.0, 2);
    const auto j = core::to_json(stats);

    EXPECT_DOUBLE_EQ(j.at("run_time_minutes").get<double>(), 1.5);
    EXPECT_EQ(j.at("num_sent_requests").get<std::uint64_t>(), 180u);
    EXPECT_DOUBLE_EQ(j.at("average_requests_per_second").get<double>(), 2.0);
    EXPECT_EQ(j.at("num_outstanding_requests").get<std::size_t>(), 4u);
    EXPECT_DOUBLE_EQ(j.at("seconds_behind").get<double>(), 9.0);
    EXPECT_DOUBLE_EQ(j.at("percentage_behind").get<double>(), 0.1);
    EXPECT_EQ(j.at("num_cycles").get<std::uint64_t>(), 2u);
    EXPECT_EQ(j.size(), 7u);
}

} // namespace
