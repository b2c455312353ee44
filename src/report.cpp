#include "gwt/report.hpp"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "gwt/git.hpp"

namespace gwt {

    namespace {

        std::string format_seconds(std::chrono::milliseconds value) {
            std::ostringstream output;
            output << std::fixed << std::setprecision(1) << static_cast<double>(value.count()) / 1000.0 << "s";
            return output.str();
        }

        nlohmann::json status_json(const BranchMergeStatus& status) {
            nlohmann::json json{
                {"branch", status.branch_name},
                {"status", merge_status_name(status.status)},
                {"pushStatus", push_status_name(status.push_status)},
                {"error", status.error ? nlohmann::json(*status.error) : nlohmann::json(nullptr)},
            };
            return json;
        }

        nlohmann::json summary_json(const BatchMergeSummary& summary) {
            return nlohmann::json{
                {"total", summary.total},
                {"success", summary.success},
                {"skipped", summary.skipped},
                {"failed", summary.failed},
                {"pushed", summary.pushed},
                {"pushFailed", summary.push_failed},
            };
        }

    } // namespace

    std::string render_merge_log_line(const BranchMergeStatus& status) {
        std::ostringstream output;
        output << status.branch_name << ": " << merge_status_name(status.status);
        if (status.push_status != PushStatus::kNotExecuted) {
            output << " (push " << push_status_name(status.push_status) << ")";
        }
        if (status.worktree_created) {
            output << " [new worktree]";
        }
        if (status.error) {
            output << " - " << *status.error;
        }
        return output.str();
    }

    std::string render_merge_log_line_json(const BranchMergeStatus& status) {
        return status_json(status).dump();
    }

    std::string render_progress_line(const BatchMergeProgress& progress) {
        std::ostringstream output;
        output << "[" << progress.processed << "/" << progress.total << " " << progress.percentage << "%] " << progress.branch << " (" << merge_phase_name(progress.phase)
               << ", " << format_seconds(progress.elapsed) << ")";
        return output.str();
    }

    std::string render_batch_result(const BatchMergeResult& result, bool dry_run) {
        std::ostringstream output;
        output << (dry_run ? "Batch merge (dry run)" : "Batch merge") << (result.cancelled ? ": cancelled" : "") << "\n";
        for (const auto& status : result.statuses) {
            output << "  " << render_merge_log_line(status) << "\n";
        }
        const auto& summary = result.summary;
        output << "Total: " << summary.total << ", success: " << summary.success << ", skipped: " << summary.skipped << ", failed: " << summary.failed;
        if (summary.pushed != 0 || summary.push_failed != 0) {
            output << ", pushed: " << summary.pushed << ", push failed: " << summary.push_failed;
        }
        output << "\nDuration: " << format_seconds(result.total_duration) << "\n";
        return output.str();
    }

    std::string render_batch_result_json(const BatchMergeResult& result, bool dry_run) {
        nlohmann::json statuses = nlohmann::json::array();
        for (const auto& status : result.statuses) {
            auto entry               = status_json(status);
            entry["worktreeCreated"] = status.worktree_created;
            entry["durationMs"]      = status.duration.count();
            statuses.push_back(std::move(entry));
        }
        nlohmann::json json{
            {"dryRun", dry_run},
            {"cancelled", result.cancelled},
            {"statuses", std::move(statuses)},
            {"summary", summary_json(result.summary)},
            {"totalDurationMs", result.total_duration.count()},
        };
        return json.dump();
    }

    std::string render_branches(const std::vector<BranchInfo>& branches) {
        std::ostringstream output;
        for (const auto& branch : branches) {
            output << (branch.is_current ? "* " : "  ") << branch.name << " (" << branch_kind_name(branch.kind) << ")\n";
        }
        return output.str();
    }

    std::string render_branches_json(const std::vector<BranchInfo>& branches) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& branch : branches) {
            json.push_back({{"name", branch.name}, {"type", branch_kind_name(branch.kind)}, {"current", branch.is_current}});
        }
        return json.dump();
    }

    std::string render_history(const std::vector<SessionHistoryEntry>& entries) {
        if (entries.empty()) {
            return "No sessions recorded\n";
        }
        std::ostringstream output;
        for (const auto& entry : entries) {
            output << entry.tool_id << "  " << (entry.branch.empty() ? "-" : entry.branch) << "  " << entry.session_id;
            if (!entry.worktree_path.empty()) {
                output << "  " << entry.worktree_path;
            }
            output << "\n";
        }
        return output.str();
    }

    std::string render_history_json(const std::vector<SessionHistoryEntry>& entries) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& entry : entries) {
            json.push_back({
                {"sessionId", entry.session_id},
                {"toolId", entry.tool_id},
                {"branch", entry.branch},
                {"worktreePath", entry.worktree_path},
                {"timestamp", timestamp_to_ms(entry.timestamp)},
            });
        }
        return json.dump();
    }

} // namespace gwt
