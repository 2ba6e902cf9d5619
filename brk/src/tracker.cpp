#include "brk/tracker.hpp"
#include <cstdio>

namespace brk {

Tracker Tracker::create(const Config &config,
                        std::optional<std::filesystem::path> log_path) {
    Tracker tracker;
    tracker.timer = Timer::create(config.thresholds, config.start_unpaused);
    tracker.log = SessionLog::create(config.start_unpaused
                                         ? SegmentKind::Active
                                         : SegmentKind::Pause);
    tracker.ticker.start();

    if (config.store_last_session)
        tracker.log_path = std::move(log_path);

    return tracker;
}

bool Tracker::update(float timestep_ms) {
    uint32_t ticks = ticker.update(timestep_ms);
    for (uint32_t i = 0; i < ticks; i++) {
        timer.tick();
        log.advance();
    }

    return ticks != 0;
}

void Tracker::toggle_run() {
    timer.toggle_run();
    log.close_segment();

    /* Partial second from before the toggle doesn't count towards the new
       segment. */
    ticker.start();

    store_log(false);
}

void Tracker::reset() {
    timer.reset();
    ticker.start();
}

void Tracker::store_log(bool include_current) {
    if (!log_path.has_value())
        return;

    if (!store_session_log(log, log_path.value(), include_current))
        fprintf(stderr, "Failed to store sessions to %s\n",
                log_path->string().c_str());
}

BreakState Tracker::state() const {
    return timer.current_state();
}

bool Tracker::running() const {
    return timer.running;
}

} // namespace brk
