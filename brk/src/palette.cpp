#include "brk/palette.hpp"

namespace brk {

glm::vec4 state_color(BreakState state) {
    switch (state) {
    case BreakState::BreakDue:
        return WARN_COLOR;
    case BreakState::BreakOverdue:
        return ALERT_COLOR;
    default:
        return DEFAULT_COLOR;
    }
}

const char *state_ansi_color(BreakState state) {
    switch (state) {
    case BreakState::BreakDue:
        return "\x1b[33m";
    case BreakState::BreakOverdue:
        return "\x1b[31m";
    default:
        return "\x1b[0m";
    }
}

} // namespace brk
