#ifndef GWT_REPORT_HPP
#define GWT_REPORT_HPP

#include <string>
#include <vector>

#include "gwt/batch_merge.hpp"
#include "gwt/session_history.hpp"
#include "gwt/types.hpp"

namespace gwt {

    std::string render_merge_log_line(const BranchMergeStatus& status);
    std::string render_merge_log_line_json(const BranchMergeStatus& status);
    std::string render_progress_line(const BatchMergeProgress& progress);

    std::string render_batch_result(const BatchMergeResult& result, bool dry_run);
    std::string render_batch_result_json(const BatchMergeResult& result, bool dry_run);

    std::string render_branches(const std::vector<BranchInfo>& branches);
    std::string render_branches_json(const std::vector<BranchInfo>& branches);

    std::string render_history(const std::vector<SessionHistoryEntry>& entries);
    std::string render_history_json(const std::vector<SessionHistoryEntry>& entries);

} // namespace gwt

#endif // GWT_REPORT_HPP
