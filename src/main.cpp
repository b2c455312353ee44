#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "gwt/batch_merge.hpp"
#include "gwt/command.hpp"
#include "gwt/config.hpp"
#include "gwt/git.hpp"
#include "gwt/logging.hpp"
#include "gwt/paths.hpp"
#include "gwt/report.hpp"
#include "gwt/runtime.hpp"
#include "gwt/session_resolver.hpp"

namespace {

    volatile std::sig_atomic_t g_interrupted = 0;

    void handle_interrupt(int) {
        g_interrupted = 1;
    }

    bool env_flag(const char* name) {
        const char* value = std::getenv(name);
        return value != nullptr && *value != '\0' && std::string_view(value) != "0";
    }

    int print_output(const gwt::CommandOutput& output) {
        std::FILE* stream = output.success ? stdout : stderr;
        std::fputs(output.output.c_str(), stream);
        if (!output.output.empty() && output.output.back() != '\n') {
            std::fputc('\n', stream);
        }
        return output.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    // The merge runs on a worker so Ctrl-C can stop it between branches while
    // this thread keeps printing progress.
    gwt::CommandOutput run_merge_with_progress(const gwt::Command& command, gwt::RuntimeContext context) {
        gwt::BatchMergeProgressQueue queue;
        gwt::CommandOutput           output{false, {}};
        context.on_progress = queue.callback();

        std::signal(SIGINT, handle_interrupt);
        std::jthread worker([&](std::stop_token stop) {
            auto worker_context = context;
            worker_context.stop = stop;
            output              = gwt::execute_command(command, worker_context);
            queue.close();
        });

        bool stop_sent = false;
        while (!queue.closed() || !queue.empty()) {
            if (g_interrupted != 0 && !stop_sent) {
                gwt::info_log("merge", "interrupt received, stopping after the current branch");
                worker.request_stop();
                stop_sent = true;
            }
            if (const auto progress = queue.wait_pop(std::chrono::milliseconds(100))) {
                gwt::info_log("merge", gwt::render_progress_line(*progress));
            }
        }
        worker.join();
        std::signal(SIGINT, SIG_DFL);
        return output;
    }

} // namespace

int main(int argc, char** argv) {
    gwt::set_info_log_sink(gwt::stderr_log_sink);
    gwt::set_error_log_sink(gwt::stderr_log_sink);
    gwt::set_debug_log_sink(gwt::stderr_log_sink);

    const std::vector<std::string> tokens(argv + 1, argv + argc);
    const auto                     parsed = gwt::parse_command(tokens);
    if (std::holds_alternative<gwt::ParseError>(parsed)) {
        std::fprintf(stderr, "%s\n\n%s", std::get<gwt::ParseError>(parsed).message.c_str(), gwt::usage_text().c_str());
        return 2;
    }
    const auto& command = std::get<gwt::Command>(parsed);

    const auto  paths = gwt::try_resolve_paths_from_env();
    if (!paths) {
        gwt::error_log("config", "HOME is not set");
        return EXIT_FAILURE;
    }
    std::string error;
    const auto  overrides = gwt::load_config_overrides(paths->config_path, &error);
    if (!overrides) {
        gwt::error_log("config", paths->config_path.string() + ": " + error);
        return EXIT_FAILURE;
    }
    const auto runtime_config = gwt::load_runtime_config(*paths, *overrides);
    gwt::set_debug_enabled(command.debug || runtime_config.config.debug_logging || env_flag("GWT_DEBUG"));

    try {
        gwt::ProcessGitInvoker invoker;
        gwt::GitClient         git(invoker);
        gwt::SessionResolver   resolver(paths->session_roots, &git);
        gwt::RuntimeContext    context{
               .runtime_config = runtime_config,
               .resolver       = resolver,
               .git            = git,
        };

        if (command.kind == gwt::CommandKind::kMerge) {
            return print_output(run_merge_with_progress(command, context));
        }
        return print_output(gwt::execute_command(command, context));
    } catch (const gwt::GitError& git_error) {
        gwt::error_log("git", git_error.what());
        return EXIT_FAILURE;
    }
}
