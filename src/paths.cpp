#include "gwt/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace gwt {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        std::filesystem::path require_home(const EnvConfig& env, const char* what) {
            if (!env.home) {
                throw std::runtime_error(std::string("missing HOME for ") + what);
            }
            return std::filesystem::path(*env.home);
        }

        std::filesystem::path config_root(const EnvConfig& env) {
            if (env.xdg_config_home) {
                return std::filesystem::path(*env.xdg_config_home);
            }
            return require_home(env, "config root") / ".config";
        }

        std::filesystem::path data_root(const EnvConfig& env) {
            if (env.xdg_data_home) {
                return std::filesystem::path(*env.xdg_data_home);
            }
            return require_home(env, "data root") / ".local" / "share";
        }

        std::filesystem::path state_root(const EnvConfig& env) {
            if (env.xdg_state_home) {
                return std::filesystem::path(*env.xdg_state_home);
            }
            return require_home(env, "state root") / ".local" / "state";
        }

    } // namespace

    EnvConfig env_config_from_environment() {
        return EnvConfig{
            .home              = get_env("HOME"),
            .xdg_config_home   = get_env("XDG_CONFIG_HOME"),
            .xdg_data_home     = get_env("XDG_DATA_HOME"),
            .xdg_state_home    = get_env("XDG_STATE_HOME"),
            .claude_config_dir = get_env("CLAUDE_CONFIG_DIR"),
            .codex_home        = get_env("CODEX_HOME"),
        };
    }

    SessionRoots resolve_session_roots(const EnvConfig& env) {
        const auto home = require_home(env, "session roots");

        SessionRoots roots;
        if (env.claude_config_dir) {
            roots.claude_roots.emplace_back(*env.claude_config_dir);
        }
        roots.claude_roots.push_back(home / ".claude");
        roots.claude_roots.push_back(home / ".config" / "claude");
        roots.claude_history_path  = home / ".claude" / "history.jsonl";
        roots.codex_sessions_dir   = (env.codex_home ? std::filesystem::path(*env.codex_home) : home / ".codex") / "sessions";
        roots.gemini_tmp_dir       = home / ".gemini" / "tmp";
        roots.opencode_session_dir = data_root(env) / "opencode" / "storage" / "session";
        roots.qwen_tmp_dir         = home / ".qwen" / "tmp";
        return roots;
    }

    Paths resolve_paths(const EnvConfig& env) {
        const auto base_dir   = config_root(env) / "gwt";
        const auto state_base = state_root(env) / "gwt";
        return Paths{
            .config_dir    = base_dir,
            .config_path   = base_dir / "config.json",
            .state_dir     = state_base,
            .history_path  = state_base / "history.json",
            .session_roots = resolve_session_roots(env),
        };
    }

    Paths resolve_paths_from_env() {
        return resolve_paths(env_config_from_environment());
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        if (!env.home) {
            return std::nullopt;
        }
        return resolve_paths(env);
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        return try_resolve_paths(env_config_from_environment());
    }

} // namespace gwt
