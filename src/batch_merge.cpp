#include "gwt/batch_merge.hpp"

#include "gwt/logging.hpp"

#include <algorithm>
#include <utility>

namespace gwt {

    namespace {

        using SteadyClock = std::chrono::steady_clock;

        std::chrono::milliseconds elapsed_since(SteadyClock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
        }

        bool has_branch(const std::vector<BranchInfo>& branches, std::string_view name) {
            return std::any_of(branches.begin(), branches.end(), [name](const BranchInfo& branch) { return branch.name == name; });
        }

    } // namespace

    std::string_view merge_status_name(MergeStatus status) {
        switch (status) {
            case MergeStatus::kSuccess: return "success";
            case MergeStatus::kSkipped: return "skipped";
            case MergeStatus::kFailed: return "failed";
        }
        return "failed";
    }

    std::string_view push_status_name(PushStatus status) {
        switch (status) {
            case PushStatus::kSuccess: return "success";
            case PushStatus::kFailed: return "failed";
            case PushStatus::kNotExecuted: return "not_executed";
        }
        return "not_executed";
    }

    std::string_view merge_phase_name(MergePhase phase) {
        switch (phase) {
            case MergePhase::kFetch: return "fetch";
            case MergePhase::kWorktree: return "worktree";
            case MergePhase::kMerge: return "merge";
            case MergePhase::kPush: return "push";
            case MergePhase::kCleanup: return "cleanup";
        }
        return "merge";
    }

    BatchMergeSummary summarize(const std::vector<BranchMergeStatus>& statuses) {
        BatchMergeSummary summary{.total = statuses.size()};
        for (const auto& status : statuses) {
            switch (status.status) {
                case MergeStatus::kSuccess: ++summary.success; break;
                case MergeStatus::kSkipped: ++summary.skipped; break;
                case MergeStatus::kFailed: ++summary.failed; break;
            }
            if (status.push_status == PushStatus::kSuccess) {
                ++summary.pushed;
            } else if (status.push_status == PushStatus::kFailed) {
                ++summary.push_failed;
            }
        }
        return summary;
    }

    BatchMergeService::BatchMergeService(GitPrimitives& git) : git_(git) {}

    std::string BatchMergeService::determine_source_branch() {
        const auto branches = git_.list_local_branches();
        if (has_branch(branches, "main")) {
            return "main";
        }
        if (has_branch(branches, "develop")) {
            return "develop";
        }
        if (has_branch(branches, "master")) {
            return "master";
        }
        throw BatchMergeError("cannot determine merge source branch (main, develop or master)");
    }

    std::vector<std::string> BatchMergeService::get_target_branches() {
        std::vector<std::string> targets;
        for (const auto& branch : git_.list_local_branches()) {
            if (branch.kind == BranchKind::kMain || branch.kind == BranchKind::kDevelop || branch.name == "master") {
                continue;
            }
            targets.push_back(branch.name);
        }
        return targets;
    }

    EnsuredWorktree BatchMergeService::ensure_worktree(const std::string& branch) {
        for (const auto& worktree : git_.worktree_list()) {
            if (worktree.branch == branch) {
                return {.path = worktree.path, .created = false};
            }
        }

        const auto repo_root = git_.get_repository_root();
        auto       path      = git_.generate_worktree_path(repo_root, branch);
        git_.worktree_create({.branch = branch, .path = path, .repo_root = repo_root, .is_new_branch = false, .base_branch = ""});
        return {.path = std::move(path), .created = true};
    }

    BranchMergeStatus BatchMergeService::merge_branch(const std::string& branch, const std::string& source, const BatchMergeConfig& config, bool worktree_created) {
        const auto        start = SteadyClock::now();
        BranchMergeStatus status{.branch_name = branch, .worktree_created = worktree_created};
        const auto        finish = [&](MergeStatus outcome, MergePhase phase) {
            status.status     = outcome;
            status.last_phase = phase;
            status.duration   = elapsed_since(start);
            return status;
        };

        std::string worktree_path;
        try {
            const auto ensured = ensure_worktree(branch);
            worktree_path      = ensured.path;
            status.worktree_created = status.worktree_created || ensured.created;
        } catch (const GitError& error) {
            status.error = error.what();
            return finish(MergeStatus::kFailed, MergePhase::kWorktree);
        }

        try {
            git_.merge_from_branch(worktree_path, source, config.dry_run);
        } catch (const GitError& error) {
            bool conflict = false;
            try {
                conflict = git_.has_merge_conflict(worktree_path);
            } catch (const GitError& check_error) {
                debug_log("merge", branch + ": conflict check failed: " + check_error.what());
            }
            if (!conflict) {
                status.error = error.what();
                return finish(MergeStatus::kFailed, MergePhase::kMerge);
            }
            try {
                git_.abort_merge(worktree_path);
            } catch (const GitError& abort_error) {
                debug_log("merge", branch + ": abort failed: " + abort_error.what());
            }
            return finish(MergeStatus::kSkipped, MergePhase::kCleanup);
        }

        if (config.dry_run) {
            try {
                git_.reset_to_head(worktree_path);
            } catch (const GitError& error) {
                status.error = error.what();
                return finish(MergeStatus::kFailed, MergePhase::kCleanup);
            }
            return finish(MergeStatus::kSuccess, MergePhase::kCleanup);
        }

        if (!config.auto_push) {
            return finish(MergeStatus::kSuccess, MergePhase::kMerge);
        }

        try {
            const auto current = git_.get_current_branch_name(worktree_path);
            git_.push_branch_to_remote(worktree_path, current.empty() ? branch : current, config.remote);
            status.push_status = PushStatus::kSuccess;
        } catch (const GitError& error) {
            status.push_status = PushStatus::kFailed;
            status.error       = error.what();
        }
        return finish(MergeStatus::kSuccess, MergePhase::kPush);
    }

    BatchMergeResult BatchMergeService::execute_batch_merge(const BatchMergeConfig& config, const BatchMergeProgressCallback& on_progress, std::stop_token stop) {
        if (config.source_branch.empty()) {
            throw BatchMergeError("source branch is required");
        }
        if (config.target_branches.empty()) {
            throw BatchMergeError("no target branches to merge");
        }
        if (config.auto_push && config.remote.empty()) {
            throw BatchMergeError("remote is required when auto push is enabled");
        }

        const auto start = SteadyClock::now();
        try {
            git_.fetch_all_remotes();
        } catch (const GitError& error) {
            throw BatchMergeError(std::string("fetch failed: ") + error.what());
        }

        BatchMergeResult result;
        const auto       total = config.target_branches.size();
        for (size_t index = 0; index < total; ++index) {
            if (stop.stop_requested()) {
                result.cancelled = true;
                debug_log("merge", "cancelled after " + std::to_string(index) + " of " + std::to_string(total));
                break;
            }

            const auto& branch = config.target_branches[index];
            auto        status = merge_branch(branch, config.source_branch, config);
            debug_log("merge", branch + ": " + std::string(merge_status_name(status.status)));
            const auto phase = status.last_phase;
            result.statuses.push_back(std::move(status));

            if (on_progress) {
                const auto summary   = summarize(result.statuses);
                const auto processed = result.statuses.size();
                on_progress(BatchMergeProgress{
                    .branch     = branch,
                    .index      = index,
                    .processed  = processed,
                    .total      = total,
                    .success    = summary.success,
                    .skipped    = summary.skipped,
                    .failed     = summary.failed,
                    .percentage = static_cast<int>(processed * 100 / total),
                    .elapsed    = elapsed_since(start),
                    .phase      = phase,
                });
            }
        }

        if (!result.cancelled && stop.stop_requested()) {
            result.cancelled = true;
        }
        result.summary        = summarize(result.statuses);
        result.total_duration = elapsed_since(start);
        return result;
    }

    void BatchMergeProgressQueue::push(BatchMergeProgress progress) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push(std::move(progress));
        cv_.notify_one();
    }

    std::optional<BatchMergeProgress> BatchMergeProgressQueue::pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        auto value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    std::optional<BatchMergeProgress> BatchMergeProgressQueue::wait_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        auto value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    std::vector<BatchMergeProgress> BatchMergeProgressQueue::pop_all() {
        std::lock_guard<std::mutex>     lock(mutex_);
        std::vector<BatchMergeProgress> out;
        while (!queue_.empty()) {
            out.push_back(std::move(queue_.front()));
            queue_.pop();
        }
        return out;
    }

    void BatchMergeProgressQueue::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool BatchMergeProgressQueue::closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool BatchMergeProgressQueue::empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    BatchMergeProgressCallback BatchMergeProgressQueue::callback() {
        return [this](const BatchMergeProgress& progress) { push(progress); };
    }

} // namespace gwt
