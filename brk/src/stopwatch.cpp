#include "brk/stopwatch.hpp"

namespace brk {

void Stopwatch::start() {
    start_timepoint = std::chrono::steady_clock::now();
    accumulated_time_ms = 0.0f;
    running = true;
}

void Stopwatch::stop() {
    if (!running)
        return;

    accumulated_time_ms +=
        std::chrono::duration<float, std::milli>(
            std::chrono::steady_clock::now() - start_timepoint)
            .count();
    running = false;
}

void Stopwatch::resume() {
    if (running)
        return;

    start_timepoint = std::chrono::steady_clock::now();
    running = true;
}

float Stopwatch::elapsed_time_ms() const {
    if (running) {
        float diff = std::chrono::duration<float, std::milli>(
                         std::chrono::steady_clock::now() - start_timepoint)
                         .count();
        return accumulated_time_ms + diff;
    }

    return accumulated_time_ms;
}

float Stopwatch::lap_ms() {
    std::chrono::steady_clock::time_point now =
        std::chrono::steady_clock::now();

    float lap = accumulated_time_ms;
    if (running)
        lap += std::chrono::duration<float, std::milli>(now - start_timepoint)
                   .count();

    start_timepoint = now;
    accumulated_time_ms = 0.0f;
    running = true;

    return lap;
}

} // namespace brk
