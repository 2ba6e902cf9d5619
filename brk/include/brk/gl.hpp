#ifndef BRK_GL_HPP
#define BRK_GL_HPP

#include "glm/vec4.hpp"
#include <cstdint>

namespace brk::gl {

/* Loads GL function pointers for the current context. */
[[nodiscard]] bool init();

void clear(const glm::vec4 &color, int32_t width, int32_t height);

} // namespace brk::gl

#endif
