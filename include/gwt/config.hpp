#ifndef GWT_CONFIG_HPP
#define GWT_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gwt {

    inline constexpr std::chrono::milliseconds kDefaultSessionWindow{30 * 60 * 1000};
    inline constexpr std::chrono::milliseconds kDefaultWaitTimeout{120'000};
    inline constexpr std::chrono::milliseconds kDefaultPollInterval{2'000};

    struct Config {
        std::string               default_remote        = "origin";
        bool                      debug_logging         = false;
        std::chrono::milliseconds session_window        = kDefaultSessionWindow;
        std::chrono::milliseconds session_wait_timeout  = kDefaultWaitTimeout;
        std::chrono::milliseconds session_poll_interval = kDefaultPollInterval;
    };

    struct ConfigOverrides {
        std::optional<std::string>               default_remote;
        std::optional<bool>                      debug_logging;
        std::optional<std::chrono::milliseconds> session_window;
        std::optional<std::chrono::milliseconds> session_wait_timeout;
        std::optional<std::chrono::milliseconds> session_poll_interval;
    };

    Config                         apply_overrides(const Config& base, const ConfigOverrides& overrides);
    std::optional<std::string>     normalize_override_string(std::string_view value);

    // A missing file yields empty overrides; unreadable or malformed files fail.
    std::optional<ConfigOverrides> parse_config_overrides(std::string_view json_text, std::string* error);
    std::optional<ConfigOverrides> load_config_overrides(const std::filesystem::path& path, std::string* error);

} // namespace gwt

#endif // GWT_CONFIG_HPP
