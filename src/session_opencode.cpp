#include "gwt/session_strategies.hpp"

#include <utility>

namespace gwt {

    OpenCodeSessionStrategy::OpenCodeSessionStrategy(std::filesystem::path session_dir) : session_dir_(std::move(session_dir)) {}

    // Layout: <session_dir>/<projectID>/<sessionID>.json with the project
    // directory stored under "directory".
    std::optional<SessionInfo> OpenCodeSessionStrategy::find_latest(const SessionSearchOptions& options) const {
        const bool filter_cwd = options.cwd && !options.cwd->empty();
        for (const auto& candidate : rank_candidates(collect_session_files(session_dir_, true), options)) {
            auto info = read_session_info_from_file(candidate.path);
            if (!info.id) {
                continue;
            }
            if (filter_cwd && !matches_cwd(info.cwd, *options.cwd)) {
                continue;
            }
            return SessionInfo{.id = std::move(*info.id), .mtime = candidate.mtime};
        }
        return std::nullopt;
    }

    bool OpenCodeSessionStrategy::session_file_exists(std::string_view id, std::string_view) const {
        return session_file_with_id_exists(session_dir_, id);
    }

} // namespace gwt
