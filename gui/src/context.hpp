#ifndef CONTEXT_HPP
#define CONTEXT_HPP

#include "brk/config.hpp"
#include "brk/result.hpp"
#include "brk/window.hpp"
#include "counter_view.hpp"
#include <filesystem>
#include <optional>

enum class ContextError {
    NONE,
    GLFW_FAIL,
    WINDOW_FAIL,
    GL_FAIL
};

struct Context {
    static brk::Result<Context *, ContextError>
    create(const brk::Config &config,
           std::optional<std::filesystem::path> log_path);

    void close_app();
    void cleanup();

    void run_loop();

    brk::Window main_window;
    CounterView view;
    float timestep = 1.0f / 60.0f;
};

[[nodiscard]] Context *context();

#endif // CONTEXT_HPP
