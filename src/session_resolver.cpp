#include "gwt/session_resolver.hpp"

#include "gwt/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace gwt {

    namespace {

        struct ToolName {
            AgentTool        tool;
            std::string_view id;
        };

        constexpr std::array<ToolName, 6> kToolNames = {{
            {AgentTool::kClaude, "claude-code"},
            {AgentTool::kCodex, "codex-cli"},
            {AgentTool::kGemini, "gemini-cli"},
            {AgentTool::kOpenCode, "opencode"},
            {AgentTool::kQwen, "qwen-cli"},
            {AgentTool::kCustom, "custom"},
        }};

    } // namespace

    std::optional<AgentTool> parse_agent_tool(std::string_view id) {
        for (const auto& entry : kToolNames) {
            if (entry.id == id) {
                return entry.tool;
            }
        }
        return std::nullopt;
    }

    std::string_view agent_tool_id(AgentTool tool) {
        for (const auto& entry : kToolNames) {
            if (entry.tool == tool) {
                return entry.id;
            }
        }
        return "custom";
    }

    bool tool_uses_uuid_session_ids(AgentTool tool) {
        return tool != AgentTool::kQwen && tool != AgentTool::kCustom;
    }

    std::unique_ptr<SessionStrategy> make_session_strategy(AgentTool tool, const SessionRoots& roots, GitPrimitives* git) {
        switch (tool) {
            case AgentTool::kClaude: return std::make_unique<ClaudeSessionStrategy>(roots.claude_roots, roots.claude_history_path, git);
            case AgentTool::kCodex: return std::make_unique<CodexSessionStrategy>(roots.codex_sessions_dir);
            case AgentTool::kGemini: return std::make_unique<GeminiSessionStrategy>(roots.gemini_tmp_dir, git);
            case AgentTool::kOpenCode: return std::make_unique<OpenCodeSessionStrategy>(roots.opencode_session_dir);
            case AgentTool::kQwen: return std::make_unique<QwenSessionStrategy>(roots.qwen_tmp_dir);
            case AgentTool::kCustom: return nullptr;
        }
        return nullptr;
    }

    SessionResolver::SessionResolver(SessionRoots roots, GitPrimitives* git) : roots_(std::move(roots)) {
        for (const auto& entry : kToolNames) {
            strategies_[static_cast<size_t>(entry.tool)] = make_session_strategy(entry.tool, roots_, git);
        }
    }

    const SessionStrategy* SessionResolver::strategy_for(AgentTool tool) const {
        const auto index = static_cast<size_t>(tool);
        if (index >= strategies_.size()) {
            return nullptr;
        }
        return strategies_[index].get();
    }

    std::optional<SessionInfo> SessionResolver::find_latest_session(AgentTool tool, const SessionSearchOptions& options) const {
        const auto* strategy = strategy_for(tool);
        if (strategy == nullptr) {
            return std::nullopt;
        }
        auto found = strategy->find_latest(options);
        if (found) {
            debug_log("session", std::string(agent_tool_id(tool)) + " session " + found->id);
        }
        return found;
    }

    std::optional<std::string> SessionResolver::find_latest_session_id(AgentTool tool, const SessionSearchOptions& options) const {
        auto found = find_latest_session(tool, options);
        if (!found) {
            return std::nullopt;
        }
        return std::move(found->id);
    }

    std::optional<std::string> SessionResolver::wait_for_session_id(AgentTool tool, const std::string& cwd, const WaitOptions& options) const {
        if (options.poll_interval <= std::chrono::milliseconds::zero()) {
            throw std::invalid_argument("poll interval must be positive");
        }
        const ClockFunction now   = options.now ? options.now : ClockFunction([] { return std::chrono::steady_clock::now(); });
        const SleepFunction sleep = options.sleep ? options.sleep : SleepFunction([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); });

        auto                search = options.search;
        if (!search.cwd) {
            search.cwd = cwd;
        }

        const auto deadline = now() + options.timeout;
        while (now() < deadline) {
            if (auto id = find_latest_session_id(tool, search)) {
                return id;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
            if (remaining <= std::chrono::milliseconds::zero()) {
                break;
            }
            sleep(std::min(options.poll_interval, remaining));
        }
        debug_log("session", std::string(agent_tool_id(tool)) + " wait timed out for " + cwd);
        return std::nullopt;
    }

    std::future<std::optional<std::string>> SessionResolver::wait_for_session_id_async(AgentTool tool, std::string cwd, WaitOptions options) const {
        return std::async(std::launch::async, [this, tool, cwd = std::move(cwd), options = std::move(options)]() { return wait_for_session_id(tool, cwd, options); });
    }

    bool SessionResolver::session_file_exists(AgentTool tool, std::string_view id, std::string_view worktree_path) const {
        const auto* strategy = strategy_for(tool);
        if (strategy == nullptr) {
            return false;
        }
        return strategy->session_file_exists(id, worktree_path);
    }

} // namespace gwt
