#ifndef GWT_BATCH_MERGE_HPP
#define GWT_BATCH_MERGE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "gwt/git.hpp"

namespace gwt {

    enum class MergeStatus {
        kSuccess,
        kSkipped,
        kFailed,
    };

    enum class PushStatus {
        kSuccess,
        kFailed,
        kNotExecuted,
    };

    enum class MergePhase {
        kFetch,
        kWorktree,
        kMerge,
        kPush,
        kCleanup,
    };

    std::string_view merge_status_name(MergeStatus status);
    std::string_view push_status_name(PushStatus status);
    std::string_view merge_phase_name(MergePhase phase);

    struct BatchMergeConfig {
        std::string              source_branch;
        std::vector<std::string> target_branches;
        bool                     dry_run   = false;
        bool                     auto_push = false;
        std::string              remote;
    };

    struct BranchMergeStatus {
        std::string                branch_name;
        MergeStatus                status           = MergeStatus::kFailed;
        bool                       worktree_created = false;
        PushStatus                 push_status      = PushStatus::kNotExecuted;
        std::optional<std::string> error            = std::nullopt;
        std::chrono::milliseconds  duration{0};
        MergePhase                 last_phase = MergePhase::kWorktree;
    };

    struct BatchMergeSummary {
        size_t total       = 0;
        size_t success     = 0;
        size_t skipped     = 0;
        size_t failed      = 0;
        size_t pushed      = 0;
        size_t push_failed = 0;
    };

    struct BatchMergeProgress {
        std::string               branch;
        size_t                    index      = 0;
        size_t                    processed  = 0;
        size_t                    total      = 0;
        size_t                    success    = 0;
        size_t                    skipped    = 0;
        size_t                    failed     = 0;
        int                       percentage = 0;
        std::chrono::milliseconds elapsed{0};
        MergePhase                phase = MergePhase::kMerge;
    };

    struct BatchMergeResult {
        std::vector<BranchMergeStatus> statuses;
        BatchMergeSummary              summary;
        bool                           cancelled = false;
        std::chrono::milliseconds      total_duration{0};
    };

    struct EnsuredWorktree {
        std::string path;
        bool        created = false;
    };

    // Precondition failures that stop a batch before any branch is touched.
    class BatchMergeError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    using BatchMergeProgressCallback = std::function<void(const BatchMergeProgress&)>;

    BatchMergeSummary summarize(const std::vector<BranchMergeStatus>& statuses);

    class BatchMergeService {
      public:
        explicit BatchMergeService(GitPrimitives& git);

        std::string              determine_source_branch();
        std::vector<std::string> get_target_branches();
        EnsuredWorktree          ensure_worktree(const std::string& branch);
        BranchMergeStatus        merge_branch(const std::string& branch, const std::string& source, const BatchMergeConfig& config, bool worktree_created = false);

        // Branches are processed sequentially; the stop token is checked
        // before each one and an in-flight git call always completes.
        BatchMergeResult         execute_batch_merge(const BatchMergeConfig& config, const BatchMergeProgressCallback& on_progress = nullptr, std::stop_token stop = {});

      private:
        GitPrimitives& git_;
    };

    // Hands progress from the merge worker to whichever thread renders it.
    class BatchMergeProgressQueue {
      public:
        void                              push(BatchMergeProgress progress);
        std::optional<BatchMergeProgress> pop();
        std::optional<BatchMergeProgress> wait_pop(std::chrono::milliseconds timeout);
        std::vector<BatchMergeProgress>   pop_all();
        void                              close();
        bool                              closed() const;
        bool                              empty() const;

        BatchMergeProgressCallback        callback();

      private:
        mutable std::mutex             mutex_;
        std::condition_variable        cv_;
        std::queue<BatchMergeProgress> queue_;
        bool                           closed_ = false;
    };

} // namespace gwt

#endif // GWT_BATCH_MERGE_HPP
