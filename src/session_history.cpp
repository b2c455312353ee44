#include "gwt/session_history.hpp"

#include "gwt/json_utils.hpp"
#include "gwt/session_scan.hpp"
#include "gwt/session_strategies.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace gwt {

    namespace {

        constexpr int kHistoryVersion = 1;

        void          set_error(std::string* error, const char* message) {
            if (error) {
                *error = message;
            }
        }

    } // namespace

    std::optional<SessionHistoryStore> SessionHistoryStore::load(const std::filesystem::path& path, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                set_error(error, "failed to read session history");
                return std::nullopt;
            }
            return SessionHistoryStore{};
        }

        const auto contents = read_file_text(path);
        if (!contents) {
            set_error(error, "failed to read session history");
            return std::nullopt;
        }

        auto root = nlohmann::json::parse(*contents, nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            set_error(error, "invalid session history");
            return std::nullopt;
        }
        if (optional_int_field(root, "version").value_or(kHistoryVersion) != kHistoryVersion) {
            set_error(error, "unsupported session history version");
            return std::nullopt;
        }

        const auto sessions = root.value("sessions", nlohmann::json::array());
        if (!sessions.is_array()) {
            set_error(error, "invalid session history");
            return std::nullopt;
        }

        SessionHistoryStore store;
        for (const auto& item : sessions) {
            const auto id        = optional_string_field(item, "sessionId");
            const auto tool      = optional_string_field(item, "toolId");
            const auto timestamp = optional_int64_field(item, "timestamp");
            if (!id || id->empty() || !tool || !timestamp) {
                set_error(error, "invalid session history");
                return std::nullopt;
            }
            store.entries_.push_back(SessionHistoryEntry{
                .session_id    = *id,
                .tool_id       = *tool,
                .branch        = optional_string_field(item, "branch").value_or(""),
                .worktree_path = optional_string_field(item, "worktreePath").value_or(""),
                .timestamp     = timestamp_from_ms(*timestamp),
            });
        }
        return store;
    }

    bool SessionHistoryStore::save(const std::filesystem::path& path, std::string* error) const {
        if (error) {
            error->clear();
        }
        const auto parent = path.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                set_error(error, "failed to create session history directory");
                return false;
            }
        }

        nlohmann::json root;
        root["version"]  = kHistoryVersion;
        root["sessions"] = nlohmann::json::array();
        for (const auto& entry : entries_) {
            root["sessions"].push_back({
                {"sessionId", entry.session_id},
                {"toolId", entry.tool_id},
                {"branch", entry.branch},
                {"worktreePath", entry.worktree_path},
                {"timestamp", timestamp_to_ms(entry.timestamp)},
            });
        }

        std::ofstream output(path, std::ios::trunc);
        if (!output.good()) {
            set_error(error, "failed to write session history");
            return false;
        }
        output << root.dump(2) << '\n';
        if (!output.good()) {
            set_error(error, "failed to write session history");
            return false;
        }
        return true;
    }

    bool SessionHistoryStore::record(SessionHistoryEntry entry) {
        if (entry.session_id.empty() || entry.tool_id.empty()) {
            return false;
        }
        if (const auto tool = parse_agent_tool(entry.tool_id); tool && tool_uses_uuid_session_ids(*tool) && !is_valid_uuid_session_id(entry.session_id)) {
            return false;
        }
        std::erase_if(entries_, [&](const SessionHistoryEntry& existing) {
            return existing.tool_id == entry.tool_id && (existing.session_id == entry.session_id || (existing.branch == entry.branch && existing.worktree_path == entry.worktree_path));
        });
        entries_.push_back(std::move(entry));
        return true;
    }

    std::optional<SessionHistoryEntry> SessionHistoryStore::latest_for(std::string_view branch, std::string_view tool_id) const {
        const SessionHistoryEntry* best = nullptr;
        for (const auto& entry : entries_) {
            if (entry.branch != branch || entry.tool_id != tool_id) {
                continue;
            }
            if (best == nullptr || entry.timestamp >= best->timestamp) {
                best = &entry;
            }
        }
        if (best == nullptr) {
            return std::nullopt;
        }
        return *best;
    }

    const std::vector<SessionHistoryEntry>& SessionHistoryStore::entries() const {
        return entries_;
    }

} // namespace gwt
