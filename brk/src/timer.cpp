#include "brk/timer.hpp"
#include <cassert>

namespace brk {

bool Thresholds::valid() const {
    return warn_seconds < alert_seconds;
}

Timer Timer::create(const Thresholds &thresholds, bool running) {
    assert(thresholds.valid() &&
           "Warn threshold has to be smaller than alert threshold");

    Timer timer;
    timer.thresholds = thresholds;
    timer.running = running;

    return timer;
}

void Timer::tick() {
    if (!running)
        return;

    elapsed_seconds++;
}

void Timer::reset() {
    elapsed_seconds = 0;
}

void Timer::toggle_run() {
    running = !running;
}

BreakState Timer::current_state() const {
    if (elapsed_seconds >= thresholds.alert_seconds)
        return BreakState::BreakOverdue;

    if (elapsed_seconds >= thresholds.warn_seconds)
        return BreakState::BreakDue;

    return BreakState::Normal;
}

} // namespace brk
