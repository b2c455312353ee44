#include "gwt/session_strategies.hpp"

#include "gwt/json_utils.hpp"
#include "gwt/logging.hpp"
#include "gwt/strings.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace gwt {

    namespace {

        std::string normalize_separators(std::string_view cwd) {
            auto normalized = replace_all(cwd, "\\", "/");
            return replace_all(normalized, ":", "");
        }

        void push_unique(std::vector<std::string>& values, std::string value) {
            if (std::find(values.begin(), values.end(), value) == values.end()) {
                values.push_back(std::move(value));
            }
        }

    } // namespace

    std::string encode_claude_project_path(std::string_view cwd) {
        auto encoded = replace_all(normalize_separators(cwd), "_", "-");
        return replace_all(encoded, "/", "-");
    }

    std::vector<std::string> claude_project_path_candidates(std::string_view cwd) {
        auto dot_to_dash = replace_all(normalize_separators(cwd), ".", "-");
        dot_to_dash      = replace_all(dot_to_dash, "_", "-");
        dot_to_dash      = replace_all(dot_to_dash, "/", "-");

        std::vector<std::string> candidates;
        push_unique(candidates, encode_claude_project_path(cwd));
        push_unique(candidates, dot_to_dash);
        push_unique(candidates, collapse_repeats(dot_to_dash, '-'));
        return candidates;
    }

    ClaudeSessionStrategy::ClaudeSessionStrategy(std::vector<std::filesystem::path> roots, std::filesystem::path history_path, GitPrimitives* git) :
        roots_(std::move(roots)), history_path_(std::move(history_path)), git_(git) {}

    std::optional<SessionInfo> ClaudeSessionStrategy::find_latest(const SessionSearchOptions& options) const {
        std::vector<std::string> cwds;
        if (const auto branch = normalized_branch_filter(options)) {
            for (const auto& worktree : resolve_worktrees(options, git_)) {
                if (worktree.branch == *branch) {
                    push_unique(cwds, worktree.path);
                }
            }
            if (cwds.empty()) {
                debug_log("claude", "no worktree for branch " + *branch);
                return std::nullopt;
            }
        } else {
            if (!options.cwd || options.cwd->empty()) {
                return std::nullopt;
            }
            cwds.push_back(*options.cwd);
        }

        for (const auto& cwd : cwds) {
            const auto encodings = claude_project_path_candidates(cwd);
            for (const auto& root : roots_) {
                for (const auto& encoded : encodings) {
                    const auto project_dir = root / "projects" / encoded;
                    if (auto session = find_newest_session_in_dir(project_dir / "sessions", false, options)) {
                        return session;
                    }
                    if (auto session = find_newest_session_in_dir(project_dir, true, options)) {
                        return session;
                    }
                }
            }
        }
        return find_in_history(cwds);
    }

    std::optional<SessionInfo> ClaudeSessionStrategy::find_in_history(const std::vector<std::string>& cwds) const {
        const auto mtime = file_mtime(history_path_);
        if (!mtime) {
            return std::nullopt;
        }
        const auto content = read_file_text(history_path_);
        if (!content) {
            return std::nullopt;
        }

        const auto lines = split_lines(*content);
        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            if (trim_view(*it).empty()) {
                continue;
            }
            const auto parsed = parse_json_lenient(*it);
            if (!parsed) {
                continue;
            }
            const auto project    = optional_string_field(*parsed, "project");
            const auto session_id = optional_string_field(*parsed, "sessionId");
            if (!project || !session_id || !is_valid_uuid_session_id(*session_id)) {
                continue;
            }
            const bool matches = std::any_of(cwds.begin(), cwds.end(), [&](const std::string& cwd) { return matches_cwd(project, cwd); });
            if (matches) {
                return SessionInfo{.id = *session_id, .mtime = *mtime};
            }
        }
        return std::nullopt;
    }

    bool ClaudeSessionStrategy::session_file_exists(std::string_view id, std::string_view worktree_path) const {
        if (!is_valid_uuid_session_id(id)) {
            return false;
        }
        const auto file_name = std::string(id) + ".jsonl";
        for (const auto& root : roots_) {
            for (const auto& encoded : claude_project_path_candidates(worktree_path)) {
                const auto      project_dir = root / "projects" / encoded;
                std::error_code ec;
                if (std::filesystem::is_regular_file(project_dir / "sessions" / file_name, ec)) {
                    return true;
                }
                if (std::filesystem::is_regular_file(project_dir / file_name, ec)) {
                    return true;
                }
            }
        }
        return false;
    }

} // namespace gwt
