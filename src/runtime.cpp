#include "gwt/runtime.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "gwt/logging.hpp"
#include "gwt/report.hpp"
#include "gwt/session_history.hpp"

namespace gwt {

    namespace {

        std::string resolve_cwd(const Command& command, const RuntimeContext& context) {
            if (command.cwd) {
                return *command.cwd;
            }
            if (context.current_dir) {
                return context.current_dir();
            }
            std::error_code ec;
            const auto      current = std::filesystem::current_path(ec);
            return ec ? std::string() : current.string();
        }

        Timestamp runtime_now(const RuntimeContext& context) {
            return context.now ? context.now() : now_timestamp();
        }

        SessionSearchOptions search_options(const Command& command, const RuntimeContext& context, const std::string& cwd) {
            return SessionSearchOptions{
                .cwd               = cwd,
                .branch            = command.branch,
                .worktrees         = std::nullopt,
                .since             = command.since,
                .until             = command.until,
                .prefer_closest_to = command.prefer_closest_to,
                .window            = command.window.value_or(context.runtime_config.config.session_window),
            };
        }

        std::string branch_for_record(const Command& command, const RuntimeContext& context, const std::string& cwd) {
            if (command.branch) {
                return *command.branch;
            }
            try {
                return context.git.get_current_branch_name(cwd);
            } catch (const GitError& error) {
                debug_log("history", std::string("branch lookup failed: ") + error.what());
                return {};
            }
        }

        std::optional<std::string> record_session(const Command& command, const RuntimeContext& context, const std::string& cwd, const std::string& session_id) {
            const auto& path  = context.runtime_config.paths.history_path;
            std::string error;
            auto        store = SessionHistoryStore::load(path, &error);
            if (!store) {
                return error;
            }
            const bool recorded = store->record(SessionHistoryEntry{
                .session_id    = session_id,
                .tool_id       = std::string(agent_tool_id(*command.tool)),
                .branch        = branch_for_record(command, context, cwd),
                .worktree_path = cwd,
                .timestamp     = runtime_now(context),
            });
            if (!recorded) {
                return "refusing to record session \"" + session_id + "\"";
            }
            if (!store->save(path, &error)) {
                return error;
            }
            return std::nullopt;
        }

        CommandOutput render_session(const Command& command, const std::optional<SessionInfo>& session) {
            if (command.format == OutputFormat::kJson) {
                nlohmann::json json{
                    {"tool", agent_tool_id(*command.tool)},
                    {"sessionId", session ? nlohmann::json(session->id) : nlohmann::json(nullptr)},
                };
                if (session) {
                    json["mtime"] = timestamp_to_ms(session->mtime);
                }
                return CommandOutput{session.has_value(), json.dump()};
            }
            if (!session) {
                return CommandOutput{false, "no session found"};
            }
            return CommandOutput{true, session->id};
        }

        CommandOutput run_session_latest(const Command& command, const RuntimeContext& context) {
            const auto cwd     = resolve_cwd(command, context);
            const auto session = context.resolver.find_latest_session(*command.tool, search_options(command, context, cwd));
            if (session && command.record) {
                if (const auto error = record_session(command, context, cwd, session->id)) {
                    error_log("history", *error);
                    return CommandOutput{false, *error};
                }
            }
            return render_session(command, session);
        }

        CommandOutput run_session_wait(const Command& command, const RuntimeContext& context) {
            const auto& config = context.runtime_config.config;
            const auto  cwd    = resolve_cwd(command, context);
            WaitOptions options{
                .timeout       = command.timeout.value_or(config.session_wait_timeout),
                .poll_interval = command.poll_interval.value_or(config.session_poll_interval),
                .search        = search_options(command, context, cwd),
                .sleep         = context.sleep,
                .now           = context.clock,
            };
            std::optional<std::string> id;
            try {
                id = context.resolver.wait_for_session_id(*command.tool, cwd, options);
            } catch (const std::invalid_argument& error) {
                error_log("session", error.what());
                return CommandOutput{false, error.what()};
            }
            if (!id) {
                if (command.format == OutputFormat::kJson) {
                    return render_session(command, std::nullopt);
                }
                return CommandOutput{false, "timed out waiting for session"};
            }
            if (command.record) {
                if (const auto error = record_session(command, context, cwd, *id)) {
                    error_log("history", *error);
                    return CommandOutput{false, *error};
                }
            }
            if (command.format == OutputFormat::kJson) {
                return CommandOutput{true, nlohmann::json{{"tool", agent_tool_id(*command.tool)}, {"sessionId", *id}}.dump()};
            }
            return CommandOutput{true, *id};
        }

        CommandOutput run_session_check(const Command& command, const RuntimeContext& context) {
            const auto cwd    = resolve_cwd(command, context);
            const bool exists = context.resolver.session_file_exists(*command.tool, *command.session_id, cwd);
            if (command.format == OutputFormat::kJson) {
                return CommandOutput{exists, nlohmann::json{{"sessionId", *command.session_id}, {"exists", exists}}.dump()};
            }
            return CommandOutput{exists, exists ? "found" : "not found"};
        }

        CommandOutput run_merge(const Command& command, const RuntimeContext& context) {
            BatchMergeService service(context.git);
            try {
                BatchMergeConfig config{
                    .source_branch   = command.source_branch ? *command.source_branch : service.determine_source_branch(),
                    .target_branches = command.target_branches.empty() ? service.get_target_branches() : command.target_branches,
                    .dry_run         = command.dry_run,
                    .auto_push       = command.auto_push,
                    .remote          = command.remote.value_or(context.runtime_config.config.default_remote),
                };
                config.target_branches.erase(std::remove(config.target_branches.begin(), config.target_branches.end(), config.source_branch), config.target_branches.end());
                debug_log("merge", "source " + config.source_branch + ", " + std::to_string(config.target_branches.size()) + " target(s)");

                const auto result  = service.execute_batch_merge(config, context.on_progress, context.stop);
                const bool success = result.summary.failed == 0 && !result.cancelled;
                const auto output  = command.format == OutputFormat::kJson ? render_batch_result_json(result, config.dry_run) : render_batch_result(result, config.dry_run);
                return CommandOutput{success, output};
            } catch (const BatchMergeError& error) {
                error_log("merge", error.what());
                return CommandOutput{false, error.what()};
            } catch (const GitError& error) {
                error_log("merge", error.what());
                return CommandOutput{false, error.what()};
            }
        }

        CommandOutput run_history(const Command& command, const RuntimeContext& context) {
            std::string error;
            const auto  store = SessionHistoryStore::load(context.runtime_config.paths.history_path, &error);
            if (!store) {
                error_log("history", error);
                return CommandOutput{false, error};
            }
            std::vector<SessionHistoryEntry> entries;
            for (const auto& entry : store->entries()) {
                if (command.branch && entry.branch != *command.branch) {
                    continue;
                }
                if (command.tool && entry.tool_id != agent_tool_id(*command.tool)) {
                    continue;
                }
                entries.push_back(entry);
            }
            const auto output = command.format == OutputFormat::kJson ? render_history_json(entries) : render_history(entries);
            return CommandOutput{true, output};
        }

        CommandOutput run_branches(const Command& command, const RuntimeContext& context) {
            try {
                const auto branches = context.git.list_local_branches();
                const auto output   = command.format == OutputFormat::kJson ? render_branches_json(branches) : render_branches(branches);
                return CommandOutput{true, output};
            } catch (const GitError& error) {
                error_log("git", error.what());
                return CommandOutput{false, error.what()};
            }
        }

    } // namespace

    RuntimeConfig load_runtime_config(const Paths& paths, const ConfigOverrides& overrides) {
        return RuntimeConfig{
            .paths  = paths,
            .config = apply_overrides(Config{}, overrides),
        };
    }

    CommandOutput execute_command(const Command& command, const RuntimeContext& context) {
        switch (command.kind) {
            case CommandKind::kHelp: return CommandOutput{true, usage_text()};
            case CommandKind::kSessionLatest: return run_session_latest(command, context);
            case CommandKind::kSessionWait: return run_session_wait(command, context);
            case CommandKind::kSessionCheck: return run_session_check(command, context);
            case CommandKind::kMerge: return run_merge(command, context);
            case CommandKind::kHistory: return run_history(command, context);
            case CommandKind::kBranches: return run_branches(command, context);
        }
        return CommandOutput{false, "unknown command"};
    }

    CommandOutput run_command(const std::vector<std::string>& tokens, const RuntimeContext& context) {
        const auto parsed = parse_command(tokens);
        if (std::holds_alternative<ParseError>(parsed)) {
            return CommandOutput{false, std::get<ParseError>(parsed).message + "\n\n" + usage_text()};
        }
        return execute_command(std::get<Command>(parsed), context);
    }

} // namespace gwt
