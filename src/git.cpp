#include "gwt/git.hpp"

#include "gwt/logging.hpp"
#include "gwt/strings.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace gwt {

    namespace {

        constexpr std::string_view kHeadsPrefix      = "refs/heads/";
        constexpr std::string_view kPathSpecialChars = "/\\:*?\"<>|";

        std::string                failure_message(const ProcessResult& result) {
            auto message = trim_copy(result.stderr_text);
            if (message.empty()) {
                message = trim_copy(result.stdout_text);
            }
            if (message.empty()) {
                message = "exit code " + std::to_string(result.exit_code);
            }
            return message;
        }

        bool starts_with(std::string_view value, std::string_view prefix) {
            return value.substr(0, prefix.size()) == prefix;
        }

    } // namespace

    ProcessGitInvoker::ProcessGitInvoker(std::string git_binary) : git_binary_(std::move(git_binary)) {}

    ProcessResult ProcessGitInvoker::invoke(const std::vector<std::string>& args, const std::optional<std::string>& cwd) {
        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(git_binary_);
        argv.insert(argv.end(), args.begin(), args.end());

        std::optional<std::filesystem::path> workdir;
        if (cwd) {
            workdir = std::filesystem::path(*cwd);
        }
        auto result = run_process(argv, workdir);
        if (!result) {
            throw GitError(format_git_error({.context = git_binary_, .message = result.error()}));
        }
        return std::move(*result);
    }

    BranchKind classify_branch(std::string_view name) {
        if (name == "main" || name == "master") {
            return BranchKind::kMain;
        }
        if (name == "develop" || name == "dev") {
            return BranchKind::kDevelop;
        }
        if (starts_with(name, "feature/")) {
            return BranchKind::kFeature;
        }
        if (starts_with(name, "hotfix/")) {
            return BranchKind::kHotfix;
        }
        if (starts_with(name, "release/")) {
            return BranchKind::kRelease;
        }
        return BranchKind::kOther;
    }

    std::string_view branch_kind_name(BranchKind kind) {
        switch (kind) {
            case BranchKind::kMain: return "main";
            case BranchKind::kDevelop: return "develop";
            case BranchKind::kFeature: return "feature";
            case BranchKind::kHotfix: return "hotfix";
            case BranchKind::kRelease: return "release";
            case BranchKind::kOther: return "other";
        }
        return "other";
    }

    std::string sanitize_branch_for_path(std::string_view branch) {
        std::string sanitized(branch);
        for (auto& ch : sanitized) {
            if (kPathSpecialChars.find(ch) != std::string_view::npos) {
                ch = '-';
            }
        }
        return sanitized;
    }

    std::string default_worktree_path(std::string_view repo_root, std::string_view branch) {
        return (std::filesystem::path(repo_root) / ".git" / "worktree" / sanitize_branch_for_path(branch)).string();
    }

    // Expects `git branch --format='%(HEAD) %(refname:short)'` output.
    std::vector<BranchInfo> parse_local_branches(std::string_view output) {
        std::vector<BranchInfo> branches;
        for (const auto& raw : split_lines(output)) {
            std::string_view line = raw;
            bool             current = false;
            if (!line.empty() && line.front() == '*') {
                current = true;
                line.remove_prefix(1);
            }
            const auto name = trim_copy(line);
            if (name.empty() || name.front() == '(') {
                continue;
            }
            branches.push_back({.name = name, .kind = classify_branch(name), .is_current = current});
        }
        return branches;
    }

    GitResult<std::vector<WorktreeInfo>> parse_worktree_porcelain(std::string_view output) {
        std::vector<WorktreeInfo>   worktrees;
        std::optional<WorktreeInfo> current;
        const auto                  flush = [&]() {
            if (current) {
                worktrees.push_back(std::move(*current));
                current.reset();
            }
        };

        for (const auto& raw : split_lines(output)) {
            std::string_view line = raw;
            if (line.empty()) {
                flush();
                continue;
            }
            if (starts_with(line, "worktree ")) {
                flush();
                current = WorktreeInfo{.path = std::string(line.substr(9))};
                continue;
            }
            if (!current) {
                return std::unexpected(GitErrorInfo{"worktree list", "entry without worktree line"});
            }
            if (starts_with(line, "HEAD ")) {
                current->head = std::string(line.substr(5));
            } else if (starts_with(line, "branch ")) {
                auto ref = line.substr(7);
                if (starts_with(ref, kHeadsPrefix)) {
                    ref.remove_prefix(kHeadsPrefix.size());
                }
                current->branch = std::string(ref);
            }
        }
        flush();
        return worktrees;
    }

    GitClient::GitClient(GitInvoker& invoker, std::optional<std::string> repo_dir) : invoker_(invoker), repo_dir_(std::move(repo_dir)) {}

    ProcessResult GitClient::run(std::string_view context, const std::vector<std::string>& args, const std::optional<std::string>& cwd) {
        auto result = invoker_.invoke(args, cwd ? cwd : repo_dir_);
        if (!result.ok()) {
            throw GitError(format_git_error({.context = std::string(context), .message = failure_message(result)}));
        }
        return result;
    }

    std::vector<BranchInfo> GitClient::list_local_branches() {
        const auto result = run("branch", {"branch", "--format=%(HEAD) %(refname:short)"}, std::nullopt);
        return parse_local_branches(result.stdout_text);
    }

    std::vector<WorktreeInfo> GitClient::worktree_list() {
        const auto result = run("worktree list", {"worktree", "list", "--porcelain"}, std::nullopt);
        auto       parsed = parse_worktree_porcelain(result.stdout_text);
        if (!parsed) {
            throw GitError(format_git_error(parsed.error()));
        }
        return std::move(*parsed);
    }

    void GitClient::worktree_create(const WorktreeCreateRequest& request) {
        std::vector<std::string> args{"worktree", "add"};
        if (request.is_new_branch) {
            args.emplace_back("-b");
            args.push_back(request.branch);
        }
        args.push_back(request.path);
        if (request.is_new_branch && !request.base_branch.empty()) {
            args.push_back(request.base_branch);
        } else if (!request.is_new_branch) {
            args.push_back(request.branch);
        }
        std::optional<std::string> cwd;
        if (!request.repo_root.empty()) {
            cwd = request.repo_root;
        }
        run("worktree add", args, cwd);
        debug_log("git", "created worktree " + request.path + " for " + request.branch);
    }

    void GitClient::worktree_remove(const std::string& path, bool force) {
        std::vector<std::string> args{"worktree", "remove"};
        if (force) {
            args.emplace_back("--force");
        }
        args.push_back(path);
        run("worktree remove", args, std::nullopt);
    }

    void GitClient::merge_from_branch(const std::string& worktree_path, const std::string& source, bool dry_run) {
        if (dry_run) {
            run("merge", {"merge", "--no-commit", "--no-ff", source}, worktree_path);
            return;
        }
        run("merge", {"merge", "--no-edit", source}, worktree_path);
    }

    bool GitClient::has_merge_conflict(const std::string& worktree_path) {
        const auto result = run("diff", {"diff", "--name-only", "--diff-filter=U"}, worktree_path);
        return !trim_view(result.stdout_text).empty();
    }

    void GitClient::abort_merge(const std::string& worktree_path) {
        run("merge --abort", {"merge", "--abort"}, worktree_path);
    }

    void GitClient::reset_to_head(const std::string& worktree_path) {
        run("reset", {"reset", "--hard", "HEAD"}, worktree_path);
    }

    void GitClient::fetch_all_remotes() {
        run("fetch", {"fetch", "--all", "--prune"}, std::nullopt);
    }

    std::string GitClient::get_current_branch_name(const std::string& worktree_path) {
        const auto result = run("branch --show-current", {"branch", "--show-current"}, worktree_path);
        return trim_copy(result.stdout_text);
    }

    bool GitClient::remote_branch_exists(const std::string& branch, const std::string& remote) {
        const auto result = invoker_.invoke({"show-ref", "--verify", "--quiet", "refs/remotes/" + remote + "/" + branch}, repo_dir_);
        return result.ok();
    }

    void GitClient::push_branch_to_remote(const std::string& worktree_path, const std::string& branch, const std::string& remote) {
        std::vector<std::string> args{"push"};
        if (!remote_branch_exists(branch, remote)) {
            args.emplace_back("--set-upstream");
        }
        args.push_back(remote);
        args.push_back(branch);
        run("push", args, worktree_path);
    }

    std::string GitClient::get_repository_root() {
        const auto            result = run("rev-parse", {"rev-parse", "--git-common-dir"}, std::nullopt);
        std::filesystem::path common_dir(trim_copy(result.stdout_text));
        if (common_dir.empty()) {
            throw GitError(format_git_error({.context = "rev-parse", .message = "empty git dir"}));
        }
        if (common_dir.is_relative()) {
            const auto base = repo_dir_ ? std::filesystem::path(*repo_dir_) : std::filesystem::current_path();
            common_dir      = base / common_dir;
        }
        return std::filesystem::absolute(common_dir).lexically_normal().parent_path().string();
    }

    std::string GitClient::generate_worktree_path(const std::string& repo_root, const std::string& branch) {
        return default_worktree_path(repo_root, branch);
    }

} // namespace gwt
