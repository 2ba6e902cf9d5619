#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

#include "brk/file_utils.hpp"
#include "brk/tracker.hpp"

static brk::Config short_config() {
    brk::Config config;
    config.thresholds = {.warn_seconds = 3, .alert_seconds = 5};
    config.store_last_session = false;

    return config;
}

TEST(Tracker, WholeSecondsBecomeTicks) {
    brk::Tracker tracker = brk::Tracker::create(short_config());

    EXPECT_FALSE(tracker.update(999.0f));
    EXPECT_EQ(tracker.timer.elapsed_seconds, 0u);

    EXPECT_TRUE(tracker.update(1.0f));
    EXPECT_EQ(tracker.timer.elapsed_seconds, 1u);

    tracker.update(2500.0f);
    EXPECT_EQ(tracker.timer.elapsed_seconds, 3u);
    ASSERT_EQ(tracker.state(), brk::BreakState::BreakDue);
}

TEST(Tracker, ReachesOverdue) {
    brk::Tracker tracker = brk::Tracker::create(short_config());
    tracker.update(5000.0f);

    ASSERT_EQ(tracker.state(), brk::BreakState::BreakOverdue);
}

TEST(Tracker, PausedTrackerKeepsElapsed) {
    brk::Tracker tracker = brk::Tracker::create(short_config());
    tracker.update(2000.0f);
    tracker.toggle_run();
    ASSERT_FALSE(tracker.running());

    tracker.update(10000.0f);
    EXPECT_EQ(tracker.timer.elapsed_seconds, 2u);
    EXPECT_EQ(tracker.log.current.kind, brk::SegmentKind::Pause);
    ASSERT_EQ(tracker.log.current.seconds, 10u) << "Pause length not tracked";
}

TEST(Tracker, ToggleDropsPartialSecond) {
    brk::Tracker tracker = brk::Tracker::create(short_config());
    tracker.update(900.0f);
    tracker.toggle_run();
    tracker.toggle_run();

    EXPECT_FALSE(tracker.update(900.0f));
    ASSERT_EQ(tracker.timer.elapsed_seconds, 0u);
}

TEST(Tracker, ResetReturnsToNormal) {
    brk::Tracker tracker = brk::Tracker::create(short_config());
    tracker.update(7000.0f);
    ASSERT_EQ(tracker.state(), brk::BreakState::BreakOverdue);

    tracker.reset();
    EXPECT_EQ(tracker.timer.elapsed_seconds, 0u);
    EXPECT_TRUE(tracker.running());
    ASSERT_EQ(tracker.state(), brk::BreakState::Normal);
}

TEST(Tracker, StartPaused) {
    brk::Config config = short_config();
    config.start_unpaused = false;

    brk::Tracker tracker = brk::Tracker::create(config);
    tracker.update(3000.0f);

    EXPECT_FALSE(tracker.running());
    EXPECT_EQ(tracker.timer.elapsed_seconds, 0u);
    EXPECT_EQ(tracker.log.break_count(), 0u);

    tracker.toggle_run();
    tracker.toggle_run();
    ASSERT_EQ(tracker.log.break_count(), 1u);
}

TEST(Tracker, LogPathIgnoredWhenDisabled) {
    brk::Tracker tracker =
        brk::Tracker::create(short_config(), "/tmp/never_written.log");

    ASSERT_FALSE(tracker.log_path.has_value());
}

TEST(Tracker, ToggleStoresLog) {
    std::filesystem::path dir =
        std::filesystem::temp_directory_path() /
        ("breakwatch_tracker_" + std::to_string(getpid()));
    std::filesystem::path path = dir / "breakwatch.log";

    brk::Config config = short_config();
    config.store_last_session = true;

    brk::Tracker tracker = brk::Tracker::create(config, path);
    tracker.update(4000.0f);
    tracker.toggle_run();

    std::optional<std::string> content = brk::get_file_content(path);
    ASSERT_TRUE(content.has_value()) << "Log was not written on toggle";
    EXPECT_EQ(content.value(), "00:00:04 active");

    tracker.update(2000.0f);
    tracker.store_log(true);
    content = brk::get_file_content(path);
    ASSERT_EQ(content.value_or(""), "00:00:04 active\n00:00:02 pause");

    std::filesystem::remove_all(dir);
}
