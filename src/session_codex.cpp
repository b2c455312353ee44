#include "gwt/session_strategies.hpp"

#include <utility>

namespace gwt {

    CodexSessionStrategy::CodexSessionStrategy(std::filesystem::path sessions_dir) : sessions_dir_(std::move(sessions_dir)) {}

    std::optional<SessionInfo> CodexSessionStrategy::find_latest(const SessionSearchOptions& options) const {
        const auto                 ordered = rank_candidates(collect_session_files(sessions_dir_, true), options);
        const bool                 filter_cwd = options.cwd && !options.cwd->empty();
        std::optional<SessionInfo> fallback_missing_cwd;

        for (const auto& candidate : ordered) {
            // Rollout files embed the id in their name: rollout-<timestamp>-<uuid>.jsonl
            auto id = find_uuid(candidate.path.filename().string());
            if (id && !filter_cwd) {
                return SessionInfo{.id = std::move(*id), .mtime = candidate.mtime};
            }

            const auto info = read_session_info_from_file(candidate.path);
            if (!id) {
                id = info.id;
            }
            if (!id) {
                continue;
            }
            if (!filter_cwd) {
                return SessionInfo{.id = std::move(*id), .mtime = candidate.mtime};
            }
            if (matches_cwd(info.cwd, *options.cwd)) {
                return SessionInfo{.id = std::move(*id), .mtime = candidate.mtime};
            }
            if (!info.cwd && !fallback_missing_cwd) {
                fallback_missing_cwd = SessionInfo{.id = std::move(*id), .mtime = candidate.mtime};
            }
        }
        return fallback_missing_cwd;
    }

    bool CodexSessionStrategy::session_file_exists(std::string_view id, std::string_view) const {
        return session_file_with_id_exists(sessions_dir_, id);
    }

} // namespace gwt
