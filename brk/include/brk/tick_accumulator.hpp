#ifndef BRK_TICK_ACCUMULATOR_HPP
#define BRK_TICK_ACCUMULATOR_HPP

#include <cstdint>

namespace brk {

/* Turns variable frame deltas into whole intervals. Leftover time is carried
   over to the next update, so a long stall produces several ticks at once. */
struct TickAccumulator {
    void start();
    void stop();
    void resume();

    /* Returns the number of whole intervals that passed. */
    [[nodiscard]] uint32_t update(float timestep_ms);

    float time_passed_ms = 0.0f;
    float interval_ms = 1000.0f;
    bool running = false;
};

} // namespace brk

#endif
