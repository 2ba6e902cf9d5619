#include "brk/format.hpp"
#include <cstdio>

namespace brk {

std::string format_elapsed(uint64_t seconds, bool full) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    uint64_t secs = seconds % 60;

    char buffer[32];
    if (hours != 0 || full) {
        snprintf(buffer, sizeof(buffer), "%02llu:%02llu:%02llu",
                 (unsigned long long)hours, (unsigned long long)minutes,
                 (unsigned long long)secs);
    } else {
        snprintf(buffer, sizeof(buffer), "%02llu:%02llu",
                 (unsigned long long)minutes, (unsigned long long)secs);
    }

    return buffer;
}

const char *state_name(BreakState state) {
    switch (state) {
    case BreakState::Normal:
        return "normal";
    case BreakState::BreakDue:
        return "break due";
    case BreakState::BreakOverdue:
        return "break overdue";
    }

    return "unknown";
}

} // namespace brk
