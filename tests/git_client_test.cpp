#include <gtest/gtest.h>

#include "gwt/git.hpp"

namespace {

    struct FakeInvoker : public gwt::GitInvoker {
        struct Call {
            std::vector<std::string>   args;
            std::optional<std::string> cwd;
        };

        std::vector<Call>               calls;
        std::vector<gwt::ProcessResult> responses;

        gwt::ProcessResult              invoke(const std::vector<std::string>& args, const std::optional<std::string>& cwd) override {
            calls.push_back({args, cwd});
            if (responses.empty()) {
                return {.exit_code = 0};
            }
            auto response = responses.front();
            responses.erase(responses.begin());
            return response;
        }
    };

    gwt::ProcessResult ok_output(std::string text) {
        return {.exit_code = 0, .stdout_text = std::move(text)};
    }

    gwt::ProcessResult failure(int code, std::string stderr_text) {
        return {.exit_code = code, .stderr_text = std::move(stderr_text)};
    }

} // namespace

TEST(GitClient, ListsLocalBranches) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output("* main\n  develop\n"));
    gwt::GitClient client(invoker, std::string("/repo"));

    const auto     branches = client.list_local_branches();

    ASSERT_EQ(branches.size(), 2u);
    EXPECT_TRUE(branches[0].is_current);
    ASSERT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"branch", "--format=%(HEAD) %(refname:short)"}));
    EXPECT_EQ(invoker.calls[0].cwd, std::optional<std::string>("/repo"));
}

TEST(GitClient, CreatesWorktreeForExistingBranch) {
    FakeInvoker    invoker;
    gwt::GitClient client(invoker);

    client.worktree_create({.branch = "feature/a", .path = "/repo/.git/worktree/feature-a", .repo_root = "/repo"});

    ASSERT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"worktree", "add", "/repo/.git/worktree/feature-a", "feature/a"}));
    EXPECT_EQ(invoker.calls[0].cwd, std::optional<std::string>("/repo"));
}

TEST(GitClient, CreatesWorktreeWithNewBranch) {
    FakeInvoker    invoker;
    gwt::GitClient client(invoker);

    client.worktree_create({.branch = "feature/b", .path = "/wt/b", .repo_root = "", .is_new_branch = true, .base_branch = "develop"});

    ASSERT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"worktree", "add", "-b", "feature/b", "/wt/b", "develop"}));
    EXPECT_FALSE(invoker.calls[0].cwd.has_value());
}

TEST(GitClient, MergeUsesDryRunFlags) {
    FakeInvoker    invoker;
    gwt::GitClient client(invoker);

    client.merge_from_branch("/wt/a", "main", true);
    client.merge_from_branch("/wt/a", "main", false);

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"merge", "--no-commit", "--no-ff", "main"}));
    EXPECT_EQ(invoker.calls[0].cwd, std::optional<std::string>("/wt/a"));
    EXPECT_EQ(invoker.calls[1].args, (std::vector<std::string>{"merge", "--no-edit", "main"}));
}

TEST(GitClient, FailedCommandThrowsWithStderr) {
    FakeInvoker invoker;
    invoker.responses.push_back(failure(1, "CONFLICT (content): Merge conflict in a.txt\n"));
    gwt::GitClient client(invoker);

    try {
        client.merge_from_branch("/wt/a", "main", false);
        FAIL() << "expected GitError";
    } catch (const gwt::GitError& error) {
        EXPECT_STREQ(error.what(), "merge: CONFLICT (content): Merge conflict in a.txt");
    }
}

TEST(GitClient, DetectsConflictsFromUnmergedPaths) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output("a.txt\n"));
    invoker.responses.push_back(ok_output("\n"));
    gwt::GitClient client(invoker);

    EXPECT_TRUE(client.has_merge_conflict("/wt/a"));
    EXPECT_FALSE(client.has_merge_conflict("/wt/a"));
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"diff", "--name-only", "--diff-filter=U"}));
}

TEST(GitClient, PushSetsUpstreamForNewRemoteBranch) {
    FakeInvoker invoker;
    invoker.responses.push_back(failure(1, ""));
    gwt::GitClient client(invoker);

    client.push_branch_to_remote("/wt/a", "feature/a", "origin");

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"show-ref", "--verify", "--quiet", "refs/remotes/origin/feature/a"}));
    EXPECT_EQ(invoker.calls[1].args, (std::vector<std::string>{"push", "--set-upstream", "origin", "feature/a"}));
    EXPECT_EQ(invoker.calls[1].cwd, std::optional<std::string>("/wt/a"));
}

TEST(GitClient, PushWithoutUpstreamFlagWhenTracked) {
    FakeInvoker    invoker;
    gwt::GitClient client(invoker);

    client.push_branch_to_remote("/wt/a", "feature/a", "origin");

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[1].args, (std::vector<std::string>{"push", "origin", "feature/a"}));
}

TEST(GitClient, RepositoryRootFromCommonDir) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output("/home/me/project/.git\n"));
    gwt::GitClient client(invoker);

    EXPECT_EQ(client.get_repository_root(), "/home/me/project");
}

TEST(GitClient, RepositoryRootResolvesRelativeCommonDir) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output(".git\n"));
    gwt::GitClient client(invoker, std::string("/srv/repo"));

    EXPECT_EQ(client.get_repository_root(), "/srv/repo");
}

TEST(GitClient, WorktreeListThrowsOnMalformedOutput) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output("branch refs/heads/main\n"));
    gwt::GitClient client(invoker);

    EXPECT_THROW(client.worktree_list(), gwt::GitError);
}

TEST(GitClient, FetchAndCurrentBranch) {
    FakeInvoker invoker;
    invoker.responses.push_back(ok_output(""));
    invoker.responses.push_back(ok_output("feature/a\n"));
    gwt::GitClient client(invoker);

    client.fetch_all_remotes();
    EXPECT_EQ(client.get_current_branch_name("/wt/a"), "feature/a");
    EXPECT_EQ(invoker.calls[0].args, (std::vector<std::string>{"fetch", "--all", "--prune"}));
    EXPECT_EQ(invoker.calls[1].args, (std::vector<std::string>{"branch", "--show-current"}));
}
