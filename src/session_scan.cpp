#include "gwt/session_scan.hpp"

#include "gwt/git.hpp"
#include "gwt/json_utils.hpp"
#include "gwt/logging.hpp"
#include "gwt/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace gwt {

    namespace {

        constexpr std::array<const char*, 4> kSessionIdKeys = {"sessionId", "session_id", "id", "conversation_id"};
        constexpr std::array<const char*, 5> kCwdKeys       = {"cwd", "workingDirectory", "workdir", "directory", "projectPath"};
        constexpr std::array<size_t, 5>      kUuidGroups    = {8, 4, 4, 4, 12};
        constexpr size_t                     kUuidLength    = 36;

        bool                                 ends_with(std::string_view value, std::string_view suffix) {
            return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
        }

        bool uuid_at(std::string_view text, size_t pos) {
            if (pos + kUuidLength > text.size()) {
                return false;
            }
            size_t cursor = pos;
            for (size_t group = 0; group < kUuidGroups.size(); ++group) {
                if (group > 0) {
                    if (text[cursor] != '-') {
                        return false;
                    }
                    ++cursor;
                }
                for (size_t i = 0; i < kUuidGroups[group]; ++i, ++cursor) {
                    if (!std::isxdigit(static_cast<unsigned char>(text[cursor]))) {
                        return false;
                    }
                }
            }
            return true;
        }

        std::string_view strip_trailing_slashes(std::string_view path) {
            while (path.size() > 1 && path.back() == '/') {
                path.remove_suffix(1);
            }
            return path;
        }

        std::string_view strip_session_extension(std::string_view name) {
            for (std::string_view ext : {".jsonl", ".json"}) {
                if (name.size() > ext.size()) {
                    const auto tail = name.substr(name.size() - ext.size());
                    if (std::equal(tail.begin(), tail.end(), ext.begin(), [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; })) {
                        return name.substr(0, name.size() - ext.size());
                    }
                }
            }
            return name;
        }

    } // namespace

    std::optional<Timestamp> file_mtime(const std::filesystem::path& path) {
        std::error_code ec;
        const auto      written = std::filesystem::last_write_time(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::file_clock::to_sys(written));
    }

    std::optional<std::string> read_file_text(const std::filesystem::path& path) {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        if (input.bad()) {
            return std::nullopt;
        }
        return buffer.str();
    }

    bool is_session_file_name(std::string_view name) {
        return ends_with(name, ".json") || ends_with(name, ".jsonl");
    }

    std::vector<FileCandidate> collect_session_files(const std::filesystem::path& dir, bool recursive) {
        std::vector<FileCandidate>        results;
        std::deque<std::filesystem::path> queue{dir};

        while (!queue.empty()) {
            const auto current = queue.front();
            queue.pop_front();

            std::error_code                     ec;
            std::filesystem::directory_iterator it(current, ec);
            if (ec) {
                continue;
            }
            const std::filesystem::directory_iterator end{};
            for (; !ec && it != end; it.increment(ec)) {
                const auto&     entry = *it;
                std::error_code status_ec;
                if (!entry.is_symlink(status_ec) && entry.is_directory(status_ec)) {
                    if (recursive) {
                        queue.push_back(entry.path());
                    }
                    continue;
                }
                if (!entry.is_regular_file(status_ec) || !is_session_file_name(entry.path().filename().string())) {
                    continue;
                }
                if (const auto mtime = file_mtime(entry.path())) {
                    results.push_back({.path = entry.path(), .mtime = *mtime});
                }
            }
        }
        return results;
    }

    std::optional<std::string> find_uuid(std::string_view text) {
        if (text.size() < kUuidLength) {
            return std::nullopt;
        }
        for (size_t pos = 0; pos + kUuidLength <= text.size(); ++pos) {
            if (uuid_at(text, pos)) {
                return std::string(text.substr(pos, kUuidLength));
            }
        }
        return std::nullopt;
    }

    bool is_valid_uuid_session_id(std::string_view id) {
        return id.size() == kUuidLength && uuid_at(id, 0);
    }

    std::optional<std::string> pick_session_id(const nlohmann::json& value) {
        if (!value.is_object()) {
            return std::nullopt;
        }
        for (const auto* key : kSessionIdKeys) {
            const auto candidate = optional_string_field(value, key);
            if (!candidate) {
                continue;
            }
            auto trimmed = trim_copy(*candidate);
            if (is_valid_uuid_session_id(trimmed)) {
                return trimmed;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> pick_cwd(const nlohmann::json& value) {
        if (!value.is_object()) {
            return std::nullopt;
        }
        for (const auto* key : kCwdKeys) {
            const auto candidate = optional_string_field(value, key);
            if (candidate && !trim_view(*candidate).empty()) {
                return candidate;
            }
        }
        const auto payload = value.find("payload");
        if (payload != value.end() && payload->is_object()) {
            return pick_cwd(*payload);
        }
        return std::nullopt;
    }

    std::optional<std::string> pick_session_id_from_text(std::string_view content) {
        if (const auto parsed = parse_json_lenient(content)) {
            if (auto id = pick_session_id(*parsed)) {
                return id;
            }
        }
        for (const auto& raw : split_lines(content)) {
            const auto line = trim_view(raw);
            if (line.empty()) {
                continue;
            }
            if (const auto parsed = parse_json_lenient(line)) {
                if (auto id = pick_session_id(*parsed)) {
                    return id;
                }
            }
            if (auto id = find_uuid(line)) {
                return id;
            }
        }
        return find_uuid(content);
    }

    SessionFileInfo pick_session_info_from_text(std::string_view content) {
        if (const auto parsed = parse_json_lenient(content)) {
            SessionFileInfo info{.id = pick_session_id(*parsed), .cwd = pick_cwd(*parsed)};
            if (info.id || info.cwd) {
                return info;
            }
        }
        for (const auto& raw : split_lines(content)) {
            const auto line = trim_view(raw);
            if (line.empty()) {
                continue;
            }
            const auto parsed = parse_json_lenient(line);
            if (!parsed) {
                continue;
            }
            SessionFileInfo info{.id = pick_session_id(*parsed), .cwd = pick_cwd(*parsed)};
            if (info.id || info.cwd) {
                return info;
            }
        }
        return {};
    }

    std::optional<std::string> read_session_id_from_file(const std::filesystem::path& path) {
        const auto name = path.filename().string();
        const auto stem = strip_session_extension(name);
        if (is_valid_uuid_session_id(stem)) {
            return std::string(stem);
        }
        const auto content = read_file_text(path);
        if (!content) {
            return std::nullopt;
        }
        if (auto id = pick_session_id_from_text(*content)) {
            return id;
        }
        return find_uuid(name);
    }

    SessionFileInfo read_session_info_from_file(const std::filesystem::path& path) {
        const auto content = read_file_text(path);
        if (!content) {
            return {};
        }
        auto info = pick_session_info_from_text(*content);
        if (info.id || info.cwd) {
            return info;
        }
        return {.id = find_uuid(path.filename().string()), .cwd = std::nullopt};
    }

    bool path_within(std::string_view child, std::string_view parent) {
        child  = strip_trailing_slashes(child);
        parent = strip_trailing_slashes(parent);
        if (parent.empty() || child.size() < parent.size() || child.substr(0, parent.size()) != parent) {
            return false;
        }
        return child.size() == parent.size() || parent.back() == '/' || child[parent.size()] == '/';
    }

    bool matches_cwd(const std::optional<std::string>& session_cwd, std::string_view target_cwd) {
        if (!session_cwd || session_cwd->empty() || target_cwd.empty()) {
            return false;
        }
        return path_within(*session_cwd, target_cwd) || path_within(target_cwd, *session_cwd);
    }

    std::vector<FileCandidate> rank_candidates(std::vector<FileCandidate> candidates, const SessionSearchOptions& options) {
        std::erase_if(candidates, [&](const FileCandidate& candidate) {
            return (options.since && candidate.mtime < *options.since) || (options.until && candidate.mtime > *options.until);
        });
        std::sort(candidates.begin(), candidates.end(), [](const FileCandidate& a, const FileCandidate& b) {
            if (a.mtime != b.mtime) {
                return a.mtime > b.mtime;
            }
            return a.path < b.path;
        });
        if (!options.prefer_closest_to) {
            return candidates;
        }

        const auto reference = *options.prefer_closest_to;
        const auto distance  = [reference](const FileCandidate& candidate) {
            const auto delta = candidate.mtime - reference;
            return delta < std::chrono::milliseconds::zero() ? -delta : delta;
        };
        const bool any_within = std::any_of(candidates.begin(), candidates.end(), [&](const FileCandidate& candidate) { return distance(candidate) <= options.window; });
        if (any_within) {
            std::stable_sort(candidates.begin(), candidates.end(), [&](const FileCandidate& a, const FileCandidate& b) { return distance(a) < distance(b); });
        }
        return candidates;
    }

    std::optional<SessionInfo> find_newest_session_in_dir(const std::filesystem::path& dir, bool recursive, const SessionSearchOptions& options) {
        for (const auto& candidate : rank_candidates(collect_session_files(dir, recursive), options)) {
            if (auto id = read_session_id_from_file(candidate.path)) {
                return SessionInfo{.id = std::move(*id), .mtime = candidate.mtime};
            }
        }
        return std::nullopt;
    }

    bool session_file_with_id_exists(const std::filesystem::path& dir, std::string_view id) {
        if (trim_view(id).empty()) {
            return false;
        }
        for (const auto& candidate : collect_session_files(dir, true)) {
            if (candidate.path.filename().string().find(id) != std::string::npos) {
                return true;
            }
            const auto found = read_session_id_from_file(candidate.path);
            if (found && *found == id) {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> normalized_branch_filter(const SessionSearchOptions& options) {
        if (!options.branch) {
            return std::nullopt;
        }
        auto trimmed = trim_copy(*options.branch);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    std::optional<std::string> resolve_branch_from_cwd(const std::optional<std::string>& cwd, const std::vector<WorktreeRef>& worktrees) {
        if (!cwd || cwd->empty()) {
            return std::nullopt;
        }
        const WorktreeRef* best = nullptr;
        for (const auto& worktree : worktrees) {
            if (!path_within(*cwd, worktree.path)) {
                continue;
            }
            if (best == nullptr || worktree.path.size() > best->path.size()) {
                best = &worktree;
            }
        }
        if (best == nullptr) {
            return std::nullopt;
        }
        return best->branch;
    }

    std::vector<WorktreeRef> resolve_worktrees(const SessionSearchOptions& options, GitPrimitives* git) {
        std::vector<WorktreeRef> worktrees;
        if (options.worktrees && !options.worktrees->empty()) {
            for (const auto& entry : *options.worktrees) {
                if (!entry.path.empty() && !entry.branch.empty()) {
                    worktrees.push_back(entry);
                }
            }
            return worktrees;
        }
        if (git == nullptr) {
            return worktrees;
        }
        try {
            for (const auto& entry : git->worktree_list()) {
                if (!entry.path.empty() && !entry.branch.empty()) {
                    worktrees.push_back({.path = entry.path, .branch = entry.branch});
                }
            }
        } catch (const GitError& error) {
            debug_log("session", std::string("worktree list failed: ") + error.what());
            worktrees.clear();
        }
        return worktrees;
    }

} // namespace gwt
