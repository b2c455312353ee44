#include "gwt/session_strategies.hpp"

#include "gwt/logging.hpp"

#include <utility>

namespace gwt {

    GeminiSessionStrategy::GeminiSessionStrategy(std::filesystem::path tmp_dir, GitPrimitives* git) : tmp_dir_(std::move(tmp_dir)), git_(git) {}

    std::optional<SessionInfo> GeminiSessionStrategy::find_latest(const SessionSearchOptions& options) const {
        const auto               branch    = normalized_branch_filter(options);
        const bool               check_cwd = !branch && options.cwd && !options.cwd->empty();
        std::vector<WorktreeRef> worktrees;
        if (branch) {
            worktrees = resolve_worktrees(options, git_);
            if (worktrees.empty()) {
                debug_log("gemini", "no worktrees to map branch " + *branch);
                return std::nullopt;
            }
        }

        for (const auto& candidate : rank_candidates(collect_session_files(tmp_dir_, true), options)) {
            auto info = read_session_info_from_file(candidate.path);
            if (!info.id) {
                continue;
            }
            if (branch && resolve_branch_from_cwd(info.cwd, worktrees) != *branch) {
                continue;
            }
            if (check_cwd && !matches_cwd(info.cwd, *options.cwd)) {
                continue;
            }
            return SessionInfo{.id = std::move(*info.id), .mtime = candidate.mtime};
        }
        return std::nullopt;
    }

    bool GeminiSessionStrategy::session_file_exists(std::string_view id, std::string_view) const {
        return session_file_with_id_exists(tmp_dir_, id);
    }

} // namespace gwt
