#include "brk/tick_accumulator.hpp"
#include <cassert>

namespace brk {

void TickAccumulator::start() {
    running = true;
    time_passed_ms = 0.0f;
}

void TickAccumulator::stop() {
    running = false;
}

void TickAccumulator::resume() {
    running = true;
}

uint32_t TickAccumulator::update(float timestep_ms) {
    assert(interval_ms > 0.0f && "Tick interval has to be positive");

    if (!running)
        return 0;

    uint32_t ticks = 0;
    time_passed_ms += timestep_ms;
    while (time_passed_ms >= interval_ms) {
        time_passed_ms -= interval_ms;
        ticks++;
    }

    return ticks;
}

} // namespace brk
