#include <gtest/gtest.h>

#include "brk/tick_accumulator.hpp"

TEST(TickAccumulator, TickFiring) {
    brk::TickAccumulator ta;
    ta.interval_ms = 150.0f;
    ta.start();

    ASSERT_EQ(ta.update(0.0f), 0u) << "Tick fired too early";
    ASSERT_EQ(ta.update(151.0f), 1u) << "Tick did not fire";
}

TEST(TickAccumulator, Stopping) {
    brk::TickAccumulator ta;
    ta.interval_ms = 150.0f;
    ta.start();

    ASSERT_EQ(ta.update(80.0f), 0u) << "Tick fired too early";

    ta.stop();
    ASSERT_EQ(ta.update(100.0f), 0u) << "Tick fired when stopped";

    ta.resume();
    ASSERT_EQ(ta.update(100.0f), 1u) << "Tick did not fire";
}

TEST(TickAccumulator, Restarting) {
    brk::TickAccumulator ta;
    ta.interval_ms = 150.0f;
    ta.start();

    ASSERT_EQ(ta.update(80.0f), 0u) << "Tick fired too early";

    ta.start();
    ASSERT_EQ(ta.update(100.0f), 0u)
        << "Tick fired even though it was restarted";

    ASSERT_EQ(ta.update(51.0f), 1u) << "Tick did not fire";
}

TEST(TickAccumulator, CatchingUp) {
    brk::TickAccumulator ta;
    ta.interval_ms = 150.0f;
    ta.start();

    ASSERT_EQ(ta.update(500.0f), 3u)
        << "Ticks did not catch up after a big delay";
    ASSERT_EQ(ta.update(99.0f), 0u);
    ASSERT_EQ(ta.update(1.0f), 1u) << "Remainder was not carried over";
}

TEST(TickAccumulator, DefaultsToOneSecond) {
    brk::TickAccumulator ta;
    ta.start();

    uint32_t ticks = 0;
    for (int frame = 0; frame < 125; frame++)
        ticks += ta.update(16.0f);

    ASSERT_EQ(ticks, 2u) << "Two seconds of frames should give two ticks";
}

TEST(TickAccumulator, NotStarted) {
    brk::TickAccumulator ta;

    ASSERT_EQ(ta.update(5000.0f), 0u);
}
