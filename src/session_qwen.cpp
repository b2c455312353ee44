#include "gwt/session_strategies.hpp"

#include <iterator>
#include <system_error>
#include <utility>

namespace gwt {

    QwenSessionStrategy::QwenSessionStrategy(std::filesystem::path tmp_dir) : tmp_dir_(std::move(tmp_dir)) {}

    std::vector<FileCandidate> QwenSessionStrategy::collect(std::string_view subdir) const {
        std::vector<FileCandidate>          candidates;
        std::error_code                     ec;
        std::filesystem::directory_iterator it(tmp_dir_, ec);
        if (ec) {
            return candidates;
        }
        const std::filesystem::directory_iterator end{};
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code status_ec;
            if (!it->is_directory(status_ec)) {
                continue;
            }
            auto dir = it->path();
            if (!subdir.empty()) {
                dir /= subdir;
            }
            auto found = collect_session_files(dir, false);
            candidates.insert(candidates.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
        }
        return candidates;
    }

    std::optional<SessionInfo> QwenSessionStrategy::pick_from(std::vector<FileCandidate> candidates, const SessionSearchOptions& options) const {
        const bool filter_cwd = options.cwd && !options.cwd->empty();
        for (const auto& candidate : rank_candidates(std::move(candidates), options)) {
            const auto content = read_file_text(candidate.path);
            if (!content) {
                continue;
            }
            // Only the content may carry an id; otherwise the whole stem is the tag.
            auto info = pick_session_info_from_text(*content);
            if (filter_cwd && info.cwd && !matches_cwd(info.cwd, *options.cwd)) {
                continue;
            }
            auto id = info.id ? std::move(*info.id) : candidate.path.stem().string();
            if (id.empty()) {
                continue;
            }
            return SessionInfo{.id = std::move(id), .mtime = candidate.mtime};
        }
        return std::nullopt;
    }

    std::optional<SessionInfo> QwenSessionStrategy::find_latest(const SessionSearchOptions& options) const {
        if (auto session = pick_from(collect(""), options)) {
            return session;
        }
        return pick_from(collect("checkpoints"), options);
    }

    bool QwenSessionStrategy::session_file_exists(std::string_view id, std::string_view) const {
        if (id.empty()) {
            return false;
        }
        for (const auto* subdir : {"", "checkpoints"}) {
            for (const auto& candidate : collect(subdir)) {
                if (candidate.path.stem().string() == id) {
                    return true;
                }
                const auto info = read_session_info_from_file(candidate.path);
                if (info.id && *info.id == id) {
                    return true;
                }
            }
        }
        return false;
    }

} // namespace gwt
