#ifndef BRK_PALETTE_HPP
#define BRK_PALETTE_HPP

#include "brk/timer.hpp"
#include "glm/vec4.hpp"

namespace brk {

inline const glm::vec4 DEFAULT_COLOR = glm::vec4(1.0f, 1.0f, 1.0f, 1.0f);
inline const glm::vec4 WARN_COLOR = glm::vec4(1.0f, 1.0f, 0.0f, 1.0f);
inline const glm::vec4 ALERT_COLOR = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);

[[nodiscard]] glm::vec4 state_color(BreakState state);

/* ANSI escape sequence selecting the terminal color for STATE. */
[[nodiscard]] const char *state_ansi_color(BreakState state);

} // namespace brk

#endif
