#ifndef BRK_TIMER_HPP
#define BRK_TIMER_HPP

#include <cstdint>

namespace brk {

enum class BreakState {
    Normal,
    BreakDue,
    BreakOverdue
};

/* Elapsed-time boundaries, WARN_SECONDS must be smaller than ALERT_SECONDS. */
struct Thresholds {
    uint64_t warn_seconds = 1200;
    uint64_t alert_seconds = 1500;

    [[nodiscard]] bool valid() const;
};

struct Timer {
    [[nodiscard]] static Timer create(const Thresholds &thresholds,
                                      bool running = true);

    void tick();
    void reset();
    void toggle_run();

    [[nodiscard]] BreakState current_state() const;

    uint64_t elapsed_seconds = 0;
    bool running = true;
    Thresholds thresholds{};
};

} // namespace brk

#endif
