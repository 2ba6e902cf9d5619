#ifndef BRK_CONFIG_HPP
#define BRK_CONFIG_HPP

#include "brk/result.hpp"
#include "brk/timer.hpp"
#include "glm/vec2.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace brk {

inline constexpr const char *CONFIG_FILE_NAME = "breakwatch.toml";
inline constexpr const char *SESSION_LOG_FILE_NAME = "breakwatch.log";

inline constexpr const char *ENV_WARN_THRESHOLD =
    "BREAKWATCH_WARN_THRESHOLD_SECONDS";
inline constexpr const char *ENV_ALERT_THRESHOLD =
    "BREAKWATCH_ALERT_THRESHOLD_SECONDS";
inline constexpr const char *ENV_START_UNPAUSED = "BREAKWATCH_START_UNPAUSED";
inline constexpr const char *ENV_STORE_LAST_SESSION =
    "BREAKWATCH_STORE_LAST_SESSION";

struct Config {
    Thresholds thresholds{};

    glm::vec2 window_size = glm::vec2(150.0f, 80.0f);
    glm::vec2 window_position = glm::vec2(40.0f, 40.0f);
    bool always_on_top = false;
    bool start_unpaused = true;
    bool store_last_session = true;
};

enum class ConfigError {
    NONE,
    PARSE_FAIL,
    INVALID_VALUE,
    INVALID_THRESHOLDS
};

[[nodiscard]] const char *config_error_name(ConfigError error);

/* Strict parse, any problem is an error. Keys that are not present keep their
   default values. */
[[nodiscard]] Result<Config, ConfigError> parse_config(const std::string &text);
[[nodiscard]] std::string serialize_config(const Config &config);

/* Platform config directory, nullopt if neither the XDG variable nor HOME (or
   APPDATA on Windows) is set. */
[[nodiscard]] std::optional<std::filesystem::path> config_dir();

/* Never fails - a missing file is created with defaults, an unreadable or
   malformed one is reported and replaced by defaults in memory. */
[[nodiscard]] Config load_config_file(const std::filesystem::path &path);

/* Defaults overridden by BREAKWATCH_* environment variables. */
[[nodiscard]] Config load_config_env();

} // namespace brk

#endif
