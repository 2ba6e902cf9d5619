#ifndef BRK_STOPWATCH_HPP
#define BRK_STOPWATCH_HPP

#include <chrono>
#include <cstdint>

namespace brk {

struct Stopwatch {
    void start();
    void stop();
    void resume();

    [[nodiscard]] float elapsed_time_ms() const;

    /* Returns elapsed time and starts over from the same instant, so no time
       is lost between consecutive laps. */
    float lap_ms();

    std::chrono::steady_clock::time_point start_timepoint{};
    float accumulated_time_ms = 0.0f;
    bool running = false;
};

} // namespace brk

#endif
