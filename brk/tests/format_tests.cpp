#include <gtest/gtest.h>

#include "brk/format.hpp"
#include "brk/palette.hpp"

TEST(Format, MinutesAndSeconds) {
    EXPECT_EQ(brk::format_elapsed(0), "00:00");
    EXPECT_EQ(brk::format_elapsed(59), "00:59");
    EXPECT_EQ(brk::format_elapsed(61), "01:01");
    ASSERT_EQ(brk::format_elapsed(3599), "59:59");
}

TEST(Format, HoursShownWhenNeeded) {
    EXPECT_EQ(brk::format_elapsed(3600), "01:00:00");
    ASSERT_EQ(brk::format_elapsed(36000 + 754), "10:12:34");
}

TEST(Format, FullAlwaysHasHours) {
    ASSERT_EQ(brk::format_elapsed(75, true), "00:01:15");
}

TEST(Format, StateNames) {
    EXPECT_STREQ(brk::state_name(brk::BreakState::Normal), "normal");
    EXPECT_STREQ(brk::state_name(brk::BreakState::BreakDue), "break due");
    ASSERT_STREQ(brk::state_name(brk::BreakState::BreakOverdue),
                 "break overdue");
}

TEST(Palette, ColorPerState) {
    EXPECT_EQ(brk::state_color(brk::BreakState::Normal), brk::DEFAULT_COLOR);
    EXPECT_EQ(brk::state_color(brk::BreakState::BreakDue), brk::WARN_COLOR);
    ASSERT_EQ(brk::state_color(brk::BreakState::BreakOverdue),
              brk::ALERT_COLOR);
}
