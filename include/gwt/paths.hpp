#ifndef GWT_PATHS_HPP
#define GWT_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gwt {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home   = std::nullopt;
        std::optional<std::string> xdg_data_home     = std::nullopt;
        std::optional<std::string> xdg_state_home    = std::nullopt;
        std::optional<std::string> claude_config_dir = std::nullopt;
        std::optional<std::string> codex_home        = std::nullopt;
    };

    // Where each coding agent keeps its sessions, in search priority order.
    struct SessionRoots {
        std::vector<std::filesystem::path> claude_roots;
        std::filesystem::path              claude_history_path;
        std::filesystem::path              codex_sessions_dir;
        std::filesystem::path              gemini_tmp_dir;
        std::filesystem::path              opencode_session_dir;
        std::filesystem::path              qwen_tmp_dir;
    };

    struct Paths {
        std::filesystem::path config_dir;
        std::filesystem::path config_path;
        std::filesystem::path state_dir;
        std::filesystem::path history_path;
        SessionRoots          session_roots;
    };

    EnvConfig            env_config_from_environment();
    SessionRoots         resolve_session_roots(const EnvConfig& env);
    Paths                resolve_paths(const EnvConfig& env);
    Paths                resolve_paths_from_env();
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();

} // namespace gwt

#endif // GWT_PATHS_HPP
