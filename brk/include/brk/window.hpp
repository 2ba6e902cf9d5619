#ifndef BRK_WINDOW_HPP
#define BRK_WINDOW_HPP

#include <cstdint>
#include <optional>
#include <queue>
#include <string>

#include "brk/event.hpp"

struct GLFWwindow;

namespace brk {

struct WindowSpec {
    int32_t width = 150;
    int32_t height = 80;
    int32_t pos_x = 40;
    int32_t pos_y = 40;
    std::string title = "breakwatch";

    bool always_on_top = false;
    bool transparent = true;
    bool resizable = true;
    bool vsync_enabled = true;
};

struct Window {
    // Initializes GLFW context, must be done before creating the first window.
    [[nodiscard]] static bool init();
    [[nodiscard]] static std::optional<Window> create(const WindowSpec &spec);

    // Terminates GLFW context and destroys every window
    static void terminate();

    /* Necessary to do each time the location of window object changes, so
       that events are caught properly. */
    void update_user_pointer();
    [[nodiscard]] bool is_open() const;
    void update();
    void close();

    void set_title(const std::string &title);

    // Flashes the taskbar entry or bounces the dock icon, platform dependent.
    void request_attention();

    GLFWwindow *handle = nullptr;
    WindowSpec spec{};

    /* Window's pending events that should be cleared and checked each
       frame. */
    std::queue<Event> pending_events;
};

} // namespace brk

#endif
