#ifndef BRK_TRACKER_HPP
#define BRK_TRACKER_HPP

#include "brk/config.hpp"
#include "brk/session_log.hpp"
#include "brk/tick_accumulator.hpp"
#include "brk/timer.hpp"
#include <filesystem>
#include <optional>

namespace brk {

/* Everything a front end drives: the timer, the clock feeding it, and the
   record of running and paused stretches. */
struct Tracker {
    /* LOG_PATH is used only when the config asks for the session log. */
    [[nodiscard]] static Tracker
    create(const Config &config,
           std::optional<std::filesystem::path> log_path = std::nullopt);

    /* Returns true if at least one tick happened. */
    bool update(float timestep_ms);
    void toggle_run();
    void reset();

    /* Writes the session log if a path is configured, failures are only
       reported. */
    void store_log(bool include_current);

    [[nodiscard]] BreakState state() const;
    [[nodiscard]] bool running() const;

    Timer timer;
    TickAccumulator ticker;
    SessionLog log;
    std::optional<std::filesystem::path> log_path;
};

} // namespace brk

#endif
