#include <gtest/gtest.h>
#include <iterator>

#include "brk/timer.hpp"

static brk::Timer twenty_minute_timer() {
    return brk::Timer::create({.warn_seconds = 1200, .alert_seconds = 1500});
}

TEST(Timer, StartsRunningAtZero) {
    brk::Timer t = twenty_minute_timer();

    EXPECT_EQ(t.elapsed_seconds, 0u);
    EXPECT_TRUE(t.running);
    ASSERT_EQ(t.current_state(), brk::BreakState::Normal);
}

TEST(Timer, TickAdvancesWhileRunning) {
    brk::Timer t = twenty_minute_timer();
    t.tick();
    t.tick();
    t.tick();

    ASSERT_EQ(t.elapsed_seconds, 3u) << "Tick did not advance the counter";
}

TEST(Timer, TickIgnoredWhilePaused) {
    brk::Timer t = twenty_minute_timer();
    t.tick();
    t.toggle_run();
    ASSERT_FALSE(t.running);

    t.tick();
    t.tick();
    EXPECT_EQ(t.elapsed_seconds, 1u) << "Paused timer kept counting";

    t.toggle_run();
    t.tick();
    ASSERT_EQ(t.elapsed_seconds, 2u) << "Timer did not resume properly";
}

TEST(Timer, ThresholdBoundaries) {
    brk::Timer t = twenty_minute_timer();

    t.elapsed_seconds = 1199;
    EXPECT_EQ(t.current_state(), brk::BreakState::Normal);

    t.elapsed_seconds = 1200;
    EXPECT_EQ(t.current_state(), brk::BreakState::BreakDue);

    t.elapsed_seconds = 1499;
    EXPECT_EQ(t.current_state(), brk::BreakState::BreakDue);

    t.elapsed_seconds = 1500;
    EXPECT_EQ(t.current_state(), brk::BreakState::BreakOverdue);

    t.elapsed_seconds = 100000;
    ASSERT_EQ(t.current_state(), brk::BreakState::BreakOverdue);
}

TEST(Timer, StatesFollowTicks) {
    brk::Timer t = brk::Timer::create({.warn_seconds = 3, .alert_seconds = 5});

    const brk::BreakState expected[] = {
        brk::BreakState::Normal,       brk::BreakState::Normal,
        brk::BreakState::Normal,       brk::BreakState::BreakDue,
        brk::BreakState::BreakDue,     brk::BreakState::BreakOverdue,
        brk::BreakState::BreakOverdue,
    };

    for (size_t i = 0; i < std::size(expected); i++) {
        EXPECT_EQ(t.current_state(), expected[i]) << "at " << i << " seconds";
        t.tick();
    }
}

TEST(Timer, ResetReturnsToNormal) {
    brk::Timer t = twenty_minute_timer();
    t.elapsed_seconds = 4000;
    ASSERT_EQ(t.current_state(), brk::BreakState::BreakOverdue);

    t.reset();
    EXPECT_EQ(t.elapsed_seconds, 0u);
    ASSERT_EQ(t.current_state(), brk::BreakState::Normal)
        << "Reset did not return to normal state";
}

TEST(Timer, ResetKeepsRunFlag) {
    brk::Timer t = twenty_minute_timer();
    t.toggle_run();
    t.elapsed_seconds = 1300;
    t.reset();

    EXPECT_FALSE(t.running);
    ASSERT_EQ(t.current_state(), brk::BreakState::Normal);
}

TEST(Timer, CreatedPaused) {
    brk::Timer t = brk::Timer::create({}, false);
    t.tick();

    ASSERT_EQ(t.elapsed_seconds, 0u);
}

TEST(Thresholds, Validity) {
    brk::Thresholds ordered{.warn_seconds = 1, .alert_seconds = 2};
    brk::Thresholds equal{.warn_seconds = 2, .alert_seconds = 2};
    brk::Thresholds inverted{.warn_seconds = 3, .alert_seconds = 2};

    EXPECT_TRUE(ordered.valid());
    EXPECT_FALSE(equal.valid());
    ASSERT_FALSE(inverted.valid());
}
