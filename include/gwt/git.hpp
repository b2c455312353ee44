#ifndef GWT_GIT_HPP
#define GWT_GIT_HPP

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "gwt/process.hpp"
#include "gwt/types.hpp"

namespace gwt {

    class GitError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct GitErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_git_error(const GitErrorInfo& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using GitResult = std::expected<T, GitErrorInfo>;

    class GitInvoker {
      public:
        virtual ~GitInvoker()                                                                                              = default;
        virtual ProcessResult invoke(const std::vector<std::string>& args, const std::optional<std::string>& cwd) = 0;
    };

    // Spawns the real git binary; throws GitError when it cannot be started.
    class ProcessGitInvoker : public GitInvoker {
      public:
        explicit ProcessGitInvoker(std::string git_binary = "git");

        ProcessResult invoke(const std::vector<std::string>& args, const std::optional<std::string>& cwd) override;

      private:
        std::string git_binary_;
    };

    BranchKind                           classify_branch(std::string_view name);
    std::string_view                     branch_kind_name(BranchKind kind);
    std::string                          sanitize_branch_for_path(std::string_view branch);
    std::string                          default_worktree_path(std::string_view repo_root, std::string_view branch);

    std::vector<BranchInfo>              parse_local_branches(std::string_view output);
    GitResult<std::vector<WorktreeInfo>> parse_worktree_porcelain(std::string_view output);

    // Narrow surface the session resolver and batch merge consume. Every call
    // blocks on a git subprocess and throws GitError on failure.
    class GitPrimitives {
      public:
        virtual ~GitPrimitives() = default;

        virtual std::vector<BranchInfo>   list_local_branches()                                                               = 0;
        virtual std::vector<WorktreeInfo> worktree_list()                                                                     = 0;
        virtual void                      worktree_create(const WorktreeCreateRequest& request)                               = 0;
        virtual void                      worktree_remove(const std::string& path, bool force)                                = 0;
        virtual void                      merge_from_branch(const std::string& worktree_path, const std::string& source, bool dry_run) = 0;
        virtual bool                      has_merge_conflict(const std::string& worktree_path)                                = 0;
        virtual void                      abort_merge(const std::string& worktree_path)                                       = 0;
        virtual void                      reset_to_head(const std::string& worktree_path)                                     = 0;
        virtual void                      fetch_all_remotes()                                                                 = 0;
        virtual std::string               get_current_branch_name(const std::string& worktree_path)                           = 0;
        virtual void                      push_branch_to_remote(const std::string& worktree_path, const std::string& branch, const std::string& remote) = 0;
        virtual std::string               get_repository_root()                                                               = 0;
        virtual std::string               generate_worktree_path(const std::string& repo_root, const std::string& branch)     = 0;
    };

    class GitClient : public GitPrimitives {
      public:
        explicit GitClient(GitInvoker& invoker, std::optional<std::string> repo_dir = std::nullopt);

        std::vector<BranchInfo>   list_local_branches() override;
        std::vector<WorktreeInfo> worktree_list() override;
        void                      worktree_create(const WorktreeCreateRequest& request) override;
        void                      worktree_remove(const std::string& path, bool force) override;
        void                      merge_from_branch(const std::string& worktree_path, const std::string& source, bool dry_run) override;
        bool                      has_merge_conflict(const std::string& worktree_path) override;
        void                      abort_merge(const std::string& worktree_path) override;
        void                      reset_to_head(const std::string& worktree_path) override;
        void                      fetch_all_remotes() override;
        std::string               get_current_branch_name(const std::string& worktree_path) override;
        void                      push_branch_to_remote(const std::string& worktree_path, const std::string& branch, const std::string& remote) override;
        std::string               get_repository_root() override;
        std::string               generate_worktree_path(const std::string& repo_root, const std::string& branch) override;

        bool                      remote_branch_exists(const std::string& branch, const std::string& remote);

      private:
        ProcessResult run(std::string_view context, const std::vector<std::string>& args, const std::optional<std::string>& cwd);

        GitInvoker&                invoker_;
        std::optional<std::string> repo_dir_;
    };

} // namespace gwt

#endif // GWT_GIT_HPP
