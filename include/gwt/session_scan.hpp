#ifndef GWT_SESSION_SCAN_HPP
#define GWT_SESSION_SCAN_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "gwt/config.hpp"
#include "gwt/types.hpp"

namespace gwt {

    class GitPrimitives;

    struct WorktreeRef {
        std::string path;
        std::string branch;
    };

    struct SessionSearchOptions {
        std::optional<std::string>              cwd               = std::nullopt;
        std::optional<std::string>              branch            = std::nullopt;
        std::optional<std::vector<WorktreeRef>> worktrees         = std::nullopt;
        std::optional<Timestamp>                since             = std::nullopt;
        std::optional<Timestamp>                until             = std::nullopt;
        std::optional<Timestamp>                prefer_closest_to = std::nullopt;
        std::chrono::milliseconds               window            = kDefaultSessionWindow;
    };

    struct SessionInfo {
        std::string id;
        Timestamp   mtime;
    };

    struct FileCandidate {
        std::filesystem::path path;
        Timestamp             mtime;
    };

    struct SessionFileInfo {
        std::optional<std::string> id;
        std::optional<std::string> cwd;
    };

    // Filesystem access. Every failure folds into "nothing found".
    std::optional<Timestamp>   file_mtime(const std::filesystem::path& path);
    std::optional<std::string> read_file_text(const std::filesystem::path& path);
    bool                       is_session_file_name(std::string_view name);
    std::vector<FileCandidate> collect_session_files(const std::filesystem::path& dir, bool recursive);

    std::optional<std::string> find_uuid(std::string_view text);
    bool                       is_valid_uuid_session_id(std::string_view id);

    std::optional<std::string> pick_session_id(const nlohmann::json& value);
    std::optional<std::string> pick_cwd(const nlohmann::json& value);
    std::optional<std::string> pick_session_id_from_text(std::string_view content);
    SessionFileInfo            pick_session_info_from_text(std::string_view content);

    // Filename UUID first, then the content, then any UUID in the filename.
    std::optional<std::string> read_session_id_from_file(const std::filesystem::path& path);
    SessionFileInfo            read_session_info_from_file(const std::filesystem::path& path);

    bool                       path_within(std::string_view child, std::string_view parent);
    bool                       matches_cwd(const std::optional<std::string>& session_cwd, std::string_view target_cwd);

    // Drops candidates outside [since, until] and orders the rest. Distance to
    // prefer_closest_to decides only when some candidate lies inside the window.
    std::vector<FileCandidate> rank_candidates(std::vector<FileCandidate> candidates, const SessionSearchOptions& options);

    // Ranks the .json/.jsonl files of `dir` and returns the first one that
    // yields a session id.
    std::optional<SessionInfo> find_newest_session_in_dir(const std::filesystem::path& dir, bool recursive, const SessionSearchOptions& options);

    // True when some session file under `dir` carries `id` in its name or content.
    bool                       session_file_with_id_exists(const std::filesystem::path& dir, std::string_view id);

    std::optional<std::string> normalized_branch_filter(const SessionSearchOptions& options);
    std::optional<std::string> resolve_branch_from_cwd(const std::optional<std::string>& cwd, const std::vector<WorktreeRef>& worktrees);

    // Explicit worktrees win; otherwise asks git. A git failure yields none.
    std::vector<WorktreeRef>   resolve_worktrees(const SessionSearchOptions& options, GitPrimitives* git);

} // namespace gwt

#endif // GWT_SESSION_SCAN_HPP
