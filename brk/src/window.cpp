#include "brk/window.hpp"
#include "GLFW/glfw3.h"
#include <cassert>
#include <cstdio>

namespace brk {

static void error_cb(int err_code, const char *description) {
    fprintf(stderr, "GLFW error #%d: %s\n", err_code, description);
}

bool Window::init() {
    glfwSetErrorCallback(error_cb);

    return glfwInit() == GLFW_TRUE;
}

static void key_cb(GLFWwindow *window, int key, int scancode, int action,
                   int mods) {
    (void)scancode;

    Event ev{};
    switch (action) {
    case GLFW_PRESS:
        ev.type = EventType::KeyPressed;
        break;
    case GLFW_RELEASE:
        ev.type = EventType::KeyReleased;
        break;
    case GLFW_REPEAT:
        ev.type = EventType::KeyHeld;
        break;
    }

    ev.key.key = (Key)key;
    ev.key.alt = (mods & GLFW_MOD_ALT) != 0;
    ev.key.shift = (mods & GLFW_MOD_SHIFT) != 0;
    ev.key.ctrl = (mods & GLFW_MOD_CONTROL) != 0;

    Window *owner = (Window *)glfwGetWindowUserPointer(window);
    if (owner != nullptr)
        owner->pending_events.push(ev);
}

static void window_size_cb(GLFWwindow *window, int width, int height) {
    Event ev{};
    ev.type = EventType::WindowResized;
    ev.window_size.width = width;
    ev.window_size.height = height;

    Window *owner = (Window *)glfwGetWindowUserPointer(window);
    if (owner == nullptr)
        return;

    owner->spec.width = width;
    owner->spec.height = height;
    owner->pending_events.push(ev);
}

static void set_window_callbacks(Window &window) {
    glfwSetKeyCallback(window.handle, key_cb);
    glfwSetWindowSizeCallback(window.handle, window_size_cb);
}

std::optional<Window> Window::create(const WindowSpec &spec) {
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_FLOATING, spec.always_on_top ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, spec.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER,
                   spec.transparent ? GLFW_TRUE : GLFW_FALSE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    Window window;
    window.handle = glfwCreateWindow(spec.width, spec.height,
                                     spec.title.c_str(), nullptr, nullptr);
    if (!window.handle) {
        return std::nullopt;
    }

    window.spec = spec;
    glfwSetWindowPos(window.handle, spec.pos_x, spec.pos_y);

    /* Window manager is free to ignore the requested size. */
    glfwGetWindowSize(window.handle, &window.spec.width, &window.spec.height);

    glfwMakeContextCurrent(window.handle);
    glfwSwapInterval(spec.vsync_enabled ? 1 : 0);
    set_window_callbacks(window);

    return window;
}

void Window::terminate() {
    glfwTerminate();
}

void Window::update_user_pointer() {
    assert(handle != nullptr &&
           "Trying to update user pointer of non-initialized window");

    glfwSetWindowUserPointer(handle, this);
}

bool Window::is_open() const {
    assert(handle != nullptr && "Trying to query non-initialized window");

    return !glfwWindowShouldClose(handle);
}

void Window::update() {
    assert(handle != nullptr && "Trying to update non-initialized window");

    glfwSwapBuffers(handle);
    glfwPollEvents();
}

void Window::close() {
    assert(handle != nullptr && "Trying to close non-initialized window");

    glfwSetWindowShouldClose(handle, GLFW_TRUE);
}

void Window::set_title(const std::string &title) {
    glfwSetWindowTitle(handle, title.c_str());
}

void Window::request_attention() {
    glfwRequestWindowAttention(handle);
}

} // namespace brk
