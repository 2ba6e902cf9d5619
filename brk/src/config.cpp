#include "brk/config.hpp"
#include "brk/file_utils.hpp"
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <string_view>
#include <strings.h>
#include <toml++/toml.hpp>

namespace brk {

const char *config_error_name(ConfigError error) {
    switch (error) {
    case ConfigError::NONE:
        return "none";
    case ConfigError::PARSE_FAIL:
        return "parse failure";
    case ConfigError::INVALID_VALUE:
        return "invalid value";
    case ConfigError::INVALID_THRESHOLDS:
        return "warn threshold is not below alert threshold";
    }

    return "unknown";
}

static bool read_seconds(const toml::node &node, uint64_t multiplier,
                         uint64_t &out) {
    const toml::value<int64_t> *value = node.as_integer();
    if (value == nullptr || value->get() < 0)
        return false;

    uint64_t seconds = (uint64_t)value->get();
    if (seconds > std::numeric_limits<uint64_t>::max() / multiplier)
        return false;

    out = seconds * multiplier;
    return true;
}

static bool read_vec2(const toml::node &node, glm::vec2 &out) {
    const toml::array *array = node.as_array();
    if (array == nullptr || array->size() != 2)
        return false;

    std::optional<double> x = array->get(0)->value<double>();
    std::optional<double> y = array->get(1)->value<double>();
    if (!array->get(0)->is_number() || !array->get(1)->is_number() ||
        !x.has_value() || !y.has_value())
        return false;

    out = glm::vec2((float)x.value(), (float)y.value());
    return true;
}

static bool read_bool(const toml::node &node, bool &out) {
    const toml::value<bool> *value = node.as_boolean();
    if (value == nullptr)
        return false;

    out = value->get();
    return true;
}

Result<Config, ConfigError> parse_config(const std::string &text) {
    Result<Config, ConfigError> result;

    toml::table table;
    try {
        table = toml::parse(text);
    } catch (const toml::parse_error &e) {
        fprintf(stderr, "Config line %u: %s\n",
                (uint32_t)e.source().begin.line,
                std::string(e.description()).c_str());
        result.error = ConfigError::PARSE_FAIL;
        return result;
    }

    Config &config = result.value;
    bool has_warn_seconds = table.contains("warn_threshold_seconds");
    bool has_alert_seconds = table.contains("alert_threshold_seconds");

    for (const auto &[toml_key, node] : table) {
        const std::string_view key = toml_key.str();
        bool ok = true;
        if (key == "warn_threshold_seconds") {
            ok = read_seconds(node, 1, config.thresholds.warn_seconds);
        } else if (key == "alert_threshold_seconds") {
            ok = read_seconds(node, 1, config.thresholds.alert_seconds);
        } else if (key == "warn_after_minutes") {
            if (!has_warn_seconds)
                ok = read_seconds(node, 60, config.thresholds.warn_seconds);
        } else if (key == "danger_after_minutes") {
            if (!has_alert_seconds)
                ok = read_seconds(node, 60, config.thresholds.alert_seconds);
        } else if (key == "window_size") {
            ok = read_vec2(node, config.window_size);
        } else if (key == "window_position") {
            ok = read_vec2(node, config.window_position);
        } else if (key == "always_on_top") {
            ok = read_bool(node, config.always_on_top);
        } else if (key == "start_unpaused") {
            ok = read_bool(node, config.start_unpaused);
        } else if (key == "store_last_session") {
            ok = read_bool(node, config.store_last_session);
        } else {
            fprintf(stderr, "Ignoring unknown config key '%s'\n",
                    std::string(key).c_str());
        }

        if (!ok) {
            fprintf(stderr, "Invalid value for config key '%s'\n",
                    std::string(key).c_str());
            result.error = ConfigError::INVALID_VALUE;
            return result;
        }
    }

    if (!config.thresholds.valid())
        result.error = ConfigError::INVALID_THRESHOLDS;

    return result;
}

std::string serialize_config(const Config &config) {
    toml::table table{
        {"warn_threshold_seconds", (int64_t)config.thresholds.warn_seconds},
        {"alert_threshold_seconds", (int64_t)config.thresholds.alert_seconds},
        {"window_size", toml::array{(double)config.window_size.x,
                                    (double)config.window_size.y}},
        {"window_position", toml::array{(double)config.window_position.x,
                                        (double)config.window_position.y}},
        {"always_on_top", config.always_on_top},
        {"start_unpaused", config.start_unpaused},
        {"store_last_session", config.store_last_session},
    };

    std::stringstream ss;
    ss << table << '\n';

    return ss.str();
}

std::optional<std::filesystem::path> config_dir() {
#if defined(_WIN32)
    const char *appdata = getenv("APPDATA");
    if (appdata != nullptr && appdata[0] != '\0')
        return std::filesystem::path(appdata);

    return std::nullopt;
#else
#if !defined(__APPLE__)
    const char *xdg = getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && std::filesystem::path(xdg).is_absolute())
        return std::filesystem::path(xdg);
#endif

    const char *home = getenv("HOME");
    if (home == nullptr || home[0] == '\0')
        return std::nullopt;

#if defined(__APPLE__)
    return std::filesystem::path(home) / "Library" / "Application Support";
#else
    return std::filesystem::path(home) / ".config";
#endif
#endif
}

Config load_config_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Config config;
        if (!write_file_content(path, serialize_config(config)))
            fprintf(stderr, "Could not write default config to %s\n",
                    path.string().c_str());

        return config;
    }

    std::optional<std::string> content = get_file_content(path);
    if (!content.has_value()) {
        fprintf(stderr, "Could not read config %s, using defaults\n",
                path.string().c_str());
        return Config{};
    }

    Result<Config, ConfigError> parsed = parse_config(content.value());
    if (parsed.error != ConfigError::NONE) {
        fprintf(stderr, "Failed to parse config %s (%s), using defaults\n",
                path.string().c_str(), config_error_name(parsed.error));
        return Config{};
    }

    return parsed.value;
}

static std::optional<uint64_t> env_seconds(const char *name) {
    const char *raw = getenv(name);
    if (raw == nullptr)
        return std::nullopt;

    uint64_t value = 0;
    const char *last = raw + strlen(raw);
    auto [ptr, ec] = std::from_chars(raw, last, value);
    if (ec != std::errc() || ptr != last || ptr == raw) {
        fprintf(stderr, "Ignoring %s='%s', expected a number of seconds\n",
                name, raw);
        return std::nullopt;
    }

    return value;
}

static std::optional<bool> env_bool(const char *name) {
    const char *raw = getenv(name);
    if (raw == nullptr)
        return std::nullopt;

    if (strcasecmp(raw, "1") == 0 || strcasecmp(raw, "true") == 0 ||
        strcasecmp(raw, "yes") == 0 || strcasecmp(raw, "on") == 0)
        return true;

    if (strcasecmp(raw, "0") == 0 || strcasecmp(raw, "false") == 0 ||
        strcasecmp(raw, "no") == 0 || strcasecmp(raw, "off") == 0)
        return false;

    fprintf(stderr, "Ignoring %s='%s', expected true or false\n", name, raw);
    return std::nullopt;
}

Config load_config_env() {
    Config config;

    Thresholds &thresholds = config.thresholds;
    thresholds.warn_seconds =
        env_seconds(ENV_WARN_THRESHOLD).value_or(thresholds.warn_seconds);
    thresholds.alert_seconds =
        env_seconds(ENV_ALERT_THRESHOLD).value_or(thresholds.alert_seconds);

    if (!thresholds.valid()) {
        fprintf(stderr,
                "Warn threshold (%llu s) must be below alert threshold "
                "(%llu s), using defaults\n",
                (unsigned long long)thresholds.warn_seconds,
                (unsigned long long)thresholds.alert_seconds);
        thresholds = Thresholds{};
    }

    config.start_unpaused =
        env_bool(ENV_START_UNPAUSED).value_or(config.start_unpaused);
    config.store_last_session =
        env_bool(ENV_STORE_LAST_SESSION).value_or(config.store_last_session);

    return config;
}

} // namespace brk
