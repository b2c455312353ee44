#ifndef GWT_TYPES_HPP
#define GWT_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gwt {

    using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

    enum class BranchKind {
        kMain,
        kDevelop,
        kFeature,
        kHotfix,
        kRelease,
        kOther,
    };

    struct BranchInfo {
        std::string name;
        BranchKind  kind       = BranchKind::kOther;
        bool        is_current = false;
    };

    struct WorktreeInfo {
        std::string                path;
        std::string                branch;
        std::optional<std::string> head = std::nullopt;
    };

    struct WorktreeCreateRequest {
        std::string branch;
        std::string path;
        std::string repo_root;
        bool        is_new_branch = false;
        std::string base_branch;
    };

    inline Timestamp now_timestamp() {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    inline Timestamp timestamp_from_ms(std::int64_t ms) {
        return Timestamp{std::chrono::milliseconds{ms}};
    }

    inline std::int64_t timestamp_to_ms(Timestamp value) {
        return value.time_since_epoch().count();
    }

} // namespace gwt

#endif // GWT_TYPES_HPP
