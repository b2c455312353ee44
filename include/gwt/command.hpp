#ifndef GWT_COMMAND_HPP
#define GWT_COMMAND_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "gwt/session_strategies.hpp"
#include "gwt/types.hpp"

namespace gwt {

    enum class CommandKind {
        kHelp,
        kSessionLatest,
        kSessionWait,
        kSessionCheck,
        kMerge,
        kHistory,
        kBranches,
    };

    enum class OutputFormat {
        kNormal,
        kJson,
    };

    struct Command {
        CommandKind                              kind;
        OutputFormat                             format            = OutputFormat::kNormal;
        bool                                     debug             = false;
        std::optional<AgentTool>                 tool              = std::nullopt;
        std::optional<std::string>               session_id        = std::nullopt;
        std::optional<std::string>               cwd               = std::nullopt;
        std::optional<std::string>               branch            = std::nullopt;
        std::optional<Timestamp>                 since             = std::nullopt;
        std::optional<Timestamp>                 until             = std::nullopt;
        std::optional<Timestamp>                 prefer_closest_to = std::nullopt;
        std::optional<std::chrono::milliseconds> window            = std::nullopt;
        std::optional<std::chrono::milliseconds> timeout           = std::nullopt;
        std::optional<std::chrono::milliseconds> poll_interval     = std::nullopt;
        bool                                     record            = false;
        std::optional<std::string>               source_branch     = std::nullopt;
        std::vector<std::string>                 target_branches   = {};
        bool                                     dry_run           = false;
        bool                                     auto_push         = false;
        std::optional<std::string>               remote            = std::nullopt;
    };

    struct ParseError {
        std::string message;
    };

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens);
    std::variant<Command, ParseError> parse_command(std::string_view args);

    std::string                       usage_text();

} // namespace gwt

#endif // GWT_COMMAND_HPP
