#include "brk/config.hpp"
#include "context.hpp"
#include <cstdio>
#include <filesystem>
#include <optional>

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    brk::Config config{};
    std::optional<std::filesystem::path> log_path;

    std::optional<std::filesystem::path> dir = brk::config_dir();
    if (dir.has_value()) {
        config = brk::load_config_file(dir.value() / brk::CONFIG_FILE_NAME);
        log_path = dir.value() / brk::SESSION_LOG_FILE_NAME;
    } else {
        fprintf(stderr, "Could not locate config directory, using defaults\n");
    }

    brk::Result<Context *, ContextError> ctx =
        Context::create(config, std::move(log_path));
    switch (ctx.error) {
    case ContextError::NONE:
        break;
    case ContextError::GLFW_FAIL:
        fprintf(stderr, "Failed to initialize windowing system\n");
        return 1;
    case ContextError::WINDOW_FAIL:
        fprintf(stderr, "Failed to create a window\n");
        return 2;
    case ContextError::GL_FAIL:
        fprintf(stderr, "Failed to load GL loader\n");
        return 3;
    }

    ctx.value->run_loop();
    ctx.value->cleanup();

    return 0;
}
