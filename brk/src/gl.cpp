#include "brk/gl.hpp"
#include <glad/glad.h>
#include "GLFW/glfw3.h"

namespace brk::gl {

bool init() {
    return gladLoadGLLoader((GLADloadproc)glfwGetProcAddress) != 0;
}

void clear(const glm::vec4 &color, int32_t width, int32_t height) {
    glViewport(0, 0, width, height);
    glClearColor(color.r, color.g, color.b, color.a);
    glClear(GL_COLOR_BUFFER_BIT);
}

} // namespace brk::gl
