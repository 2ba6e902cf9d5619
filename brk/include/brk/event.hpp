#ifndef BRK_EVENT_HPP
#define BRK_EVENT_HPP

#include <cstdint>

namespace brk {

/* Values match GLFW key codes. */
enum class Key : int {
    Unknown = -1,
    Space = 32,
    R = 82,
    Escape = 256
};

struct ResizeEvent {
    int32_t width = 0;
    int32_t height = 0;
};

struct KeyEvent {
    Key key = Key::Unknown;
    bool alt = false;
    bool shift = false;
    bool ctrl = false;
};

enum class EventType {
    None,
    WindowResized,
    KeyPressed,
    KeyReleased,
    KeyHeld
};

struct Event {
    EventType type = EventType::None;
    union {
        ResizeEvent window_size{};
        KeyEvent key;
    };
};

} // namespace brk

#endif
