#include "gwt/config.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "gwt/json_utils.hpp"
#include "gwt/strings.hpp"

namespace gwt {

    namespace {

        bool read_duration(const nlohmann::json& obj, const char* key, std::optional<std::chrono::milliseconds>* out, std::string* error) {
            if (!obj.contains(key)) {
                return true;
            }
            const auto value = optional_int64_field(obj, key);
            if (!value || *value <= 0) {
                if (error) {
                    *error = std::string("invalid ") + key;
                }
                return false;
            }
            *out = std::chrono::milliseconds{*value};
            return true;
        }

    } // namespace

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.default_remote) {
            merged.default_remote = *overrides.default_remote;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        if (overrides.session_window) {
            merged.session_window = *overrides.session_window;
        }
        if (overrides.session_wait_timeout) {
            merged.session_wait_timeout = *overrides.session_wait_timeout;
        }
        if (overrides.session_poll_interval) {
            merged.session_poll_interval = *overrides.session_poll_interval;
        }
        return merged;
    }

    std::optional<std::string> normalize_override_string(std::string_view value) {
        const auto trimmed = gwt::trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    std::optional<ConfigOverrides> parse_config_overrides(std::string_view json_text, std::string* error) {
        if (error) {
            error->clear();
        }
        const auto root = parse_json_lenient(json_text);
        if (!root || !root->is_object()) {
            if (error) {
                *error = "invalid config";
            }
            return std::nullopt;
        }

        ConfigOverrides overrides;
        if (root->contains("default_remote")) {
            const auto remote = optional_string_field(*root, "default_remote");
            if (!remote) {
                if (error) {
                    *error = "invalid default_remote";
                }
                return std::nullopt;
            }
            overrides.default_remote = normalize_override_string(*remote);
        }
        if (root->contains("debug_logging")) {
            overrides.debug_logging = optional_bool_field(*root, "debug_logging");
            if (!overrides.debug_logging) {
                if (error) {
                    *error = "invalid debug_logging";
                }
                return std::nullopt;
            }
        }

        if (root->contains("session")) {
            const auto& session = root->at("session");
            if (!session.is_object()) {
                if (error) {
                    *error = "invalid session";
                }
                return std::nullopt;
            }
            if (!read_duration(session, "window_ms", &overrides.session_window, error) || !read_duration(session, "wait_timeout_ms", &overrides.session_wait_timeout, error) ||
                !read_duration(session, "poll_interval_ms", &overrides.session_poll_interval, error)) {
                return std::nullopt;
            }
        }
        return overrides;
    }

    std::optional<ConfigOverrides> load_config_overrides(const std::filesystem::path& path, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                if (error) {
                    *error = "failed to read config";
                }
                return std::nullopt;
            }
            return ConfigOverrides{};
        }
        std::ifstream input(path);
        if (!input.good()) {
            if (error) {
                *error = "failed to read config";
            }
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return parse_config_overrides(buffer.str(), error);
    }

} // namespace gwt
