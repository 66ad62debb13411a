#include <gtest/gtest.h>

#include <absl/time/clock.h>

#include <herald_sequencer/sleep_pacer.h>

TEST(SleepPacer, PauseBlocksForInterval)
{
    herald_sequencer::SleepPacer pacer;
    auto start = absl::Now();
    pacer.pause(absl::Milliseconds(50));
    ASSERT_LE (absl::Milliseconds(50), absl::Now() - start);
}

TEST(SleepPacer, SubMillisecondIntervalStillPauses)
{
    herald_sequencer::SleepPacer pacer;
    auto start = absl::Now();
    pacer.pause(absl::Microseconds(800));
    ASSERT_LE (absl::Microseconds(800), absl::Now() - start);
}

TEST(SleepPacer, NonPositiveIntervalReturnsImmediately)
{
    herald_sequencer::SleepPacer pacer;
    auto start = absl::Now();
    pacer.pause(absl::ZeroDuration());
    pacer.pause(absl::Milliseconds(-10));
    pacer.pause(-absl::InfiniteDuration());
    ASSERT_GT (absl::Seconds(1), absl::Now() - start);
}
