#ifndef BRK_FORMAT_HPP
#define BRK_FORMAT_HPP

#include "brk/timer.hpp"
#include <cstdint>
#include <string>

namespace brk {

/* "MM:SS", or "HH:MM:SS" once an hour passed or when FULL is set. */
[[nodiscard]] std::string format_elapsed(uint64_t seconds, bool full = false);

[[nodiscard]] const char *state_name(BreakState state);

} // namespace brk

#endif
