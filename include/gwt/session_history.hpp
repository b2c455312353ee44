#ifndef GWT_SESSION_HISTORY_HPP
#define GWT_SESSION_HISTORY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gwt/types.hpp"

namespace gwt {

    struct SessionHistoryEntry {
        std::string session_id;
        std::string tool_id;
        std::string branch;
        std::string worktree_path;
        Timestamp   timestamp;
    };

    // Last known session per tool and worktree, persisted so an agent can be
    // resumed in a later run.
    class SessionHistoryStore {
      public:
        static std::optional<SessionHistoryStore> load(const std::filesystem::path& path, std::string* error);

        bool                                      save(const std::filesystem::path& path, std::string* error) const;

        // Rejects empty ids and malformed ids for UUID-keyed tools.
        bool                                      record(SessionHistoryEntry entry);
        std::optional<SessionHistoryEntry>        latest_for(std::string_view branch, std::string_view tool_id) const;
        const std::vector<SessionHistoryEntry>&   entries() const;

      private:
        std::vector<SessionHistoryEntry> entries_;
    };

} // namespace gwt

#endif // GWT_SESSION_HISTORY_HPP
