#ifndef GWT_SESSION_STRATEGIES_HPP
#define GWT_SESSION_STRATEGIES_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gwt/paths.hpp"
#include "gwt/session_scan.hpp"

namespace gwt {

    class GitPrimitives;

    enum class AgentTool {
        kClaude,
        kCodex,
        kGemini,
        kOpenCode,
        kQwen,
        kCustom,
    };

    std::optional<AgentTool> parse_agent_tool(std::string_view id);
    std::string_view         agent_tool_id(AgentTool tool);

    // Qwen tags and custom tools are free-form; every other tool keys sessions by UUID.
    bool                     tool_uses_uuid_session_ids(AgentTool tool);

    // One on-disk layout. Implementations are read-only and hold no mutable
    // state, so a single instance may serve concurrent lookups.
    class SessionStrategy {
      public:
        virtual ~SessionStrategy()                                                                                      = default;
        virtual std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const                        = 0;
        virtual bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const = 0;
    };

    std::string              encode_claude_project_path(std::string_view cwd);
    std::vector<std::string> claude_project_path_candidates(std::string_view cwd);

    // Looks under <root>/projects/<encoded cwd>/sessions, then the project
    // directory itself, then the global history.jsonl.
    class ClaudeSessionStrategy : public SessionStrategy {
      public:
        ClaudeSessionStrategy(std::vector<std::filesystem::path> roots, std::filesystem::path history_path, GitPrimitives* git);

        std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const override;
        bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const override;

      private:
        std::optional<SessionInfo> find_in_history(const std::vector<std::string>& cwds) const;

        std::vector<std::filesystem::path> roots_;
        std::filesystem::path              history_path_;
        GitPrimitives*                     git_;
    };

    class CodexSessionStrategy : public SessionStrategy {
      public:
        explicit CodexSessionStrategy(std::filesystem::path sessions_dir);

        std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const override;
        bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const override;

      private:
        std::filesystem::path sessions_dir_;
    };

    class GeminiSessionStrategy : public SessionStrategy {
      public:
        GeminiSessionStrategy(std::filesystem::path tmp_dir, GitPrimitives* git);

        std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const override;
        bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const override;

      private:
        std::filesystem::path tmp_dir_;
        GitPrimitives*        git_;
    };

    class OpenCodeSessionStrategy : public SessionStrategy {
      public:
        explicit OpenCodeSessionStrategy(std::filesystem::path session_dir);

        std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const override;
        bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const override;

      private:
        std::filesystem::path session_dir_;
    };

    // Qwen keeps per-project directories under tmp/<hash>/ and names
    // checkpoints after their tag, so the file stem doubles as the id.
    class QwenSessionStrategy : public SessionStrategy {
      public:
        explicit QwenSessionStrategy(std::filesystem::path tmp_dir);

        std::optional<SessionInfo> find_latest(const SessionSearchOptions& options) const override;
        bool                       session_file_exists(std::string_view id, std::string_view worktree_path) const override;

      private:
        std::optional<SessionInfo> pick_from(std::vector<FileCandidate> candidates, const SessionSearchOptions& options) const;
        std::vector<FileCandidate> collect(std::string_view subdir) const;

        std::filesystem::path      tmp_dir_;
    };

    // Returns nullptr for AgentTool::kCustom, which has no known layout.
    std::unique_ptr<SessionStrategy> make_session_strategy(AgentTool tool, const SessionRoots& roots, GitPrimitives* git);

} // namespace gwt

#endif // GWT_SESSION_STRATEGIES_HPP
