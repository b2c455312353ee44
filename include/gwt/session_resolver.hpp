#ifndef GWT_SESSION_RESOLVER_HPP
#define GWT_SESSION_RESOLVER_HPP

#include <array>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gwt/config.hpp"
#include "gwt/paths.hpp"
#include "gwt/session_scan.hpp"
#include "gwt/session_strategies.hpp"

namespace gwt {

    class GitPrimitives;

    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using ClockFunction = std::function<std::chrono::steady_clock::time_point()>;

    struct WaitOptions {
        std::chrono::milliseconds timeout       = kDefaultWaitTimeout;
        std::chrono::milliseconds poll_interval = kDefaultPollInterval;
        SessionSearchOptions      search        = {};
        SleepFunction             sleep         = nullptr;
        ClockFunction             now           = nullptr;
    };

    class SessionResolver {
      public:
        explicit SessionResolver(SessionRoots roots, GitPrimitives* git = nullptr);

        std::optional<SessionInfo>              find_latest_session(AgentTool tool, const SessionSearchOptions& options) const;
        std::optional<std::string>              find_latest_session_id(AgentTool tool, const SessionSearchOptions& options) const;

        // Polls until a session shows up for `cwd` or the timeout elapses.
        // Throws std::invalid_argument for a non-positive poll interval.
        std::optional<std::string>              wait_for_session_id(AgentTool tool, const std::string& cwd, const WaitOptions& options) const;

        // Runs wait_for_session_id on its own thread. The resolver must outlive
        // the returned future.
        std::future<std::optional<std::string>> wait_for_session_id_async(AgentTool tool, std::string cwd, WaitOptions options) const;

        bool                                    session_file_exists(AgentTool tool, std::string_view id, std::string_view worktree_path) const;

      private:
        const SessionStrategy* strategy_for(AgentTool tool) const;

        SessionRoots                                    roots_;
        std::array<std::unique_ptr<SessionStrategy>, 6> strategies_;
    };

} // namespace gwt

#endif // GWT_SESSION_RESOLVER_HPP
