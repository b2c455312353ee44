#ifndef GWT_RUNTIME_HPP
#define GWT_RUNTIME_HPP

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "gwt/batch_merge.hpp"
#include "gwt/command.hpp"
#include "gwt/config.hpp"
#include "gwt/git.hpp"
#include "gwt/paths.hpp"
#include "gwt/session_resolver.hpp"

namespace gwt {

    struct RuntimeConfig {
        Paths  paths;
        Config config;
    };

    struct CommandOutput {
        bool        success;
        std::string output;
    };

    // Everything a command needs from the outside world. The resolver and git
    // primitives are borrowed and must outlive the call.
    struct RuntimeContext {
        RuntimeConfig                   runtime_config;
        const SessionResolver&          resolver;
        GitPrimitives&                  git;
        std::stop_token                 stop          = {};
        BatchMergeProgressCallback      on_progress   = nullptr;
        std::function<Timestamp()>      now           = nullptr;
        SleepFunction                   sleep         = nullptr;
        ClockFunction                   clock         = nullptr;
        std::function<std::string()>    current_dir   = nullptr;
    };

    RuntimeConfig load_runtime_config(const Paths& paths, const ConfigOverrides& overrides);

    CommandOutput execute_command(const Command& command, const RuntimeContext& context);
    CommandOutput run_command(const std::vector<std::string>& tokens, const RuntimeContext& context);

} // namespace gwt

#endif // GWT_RUNTIME_HPP
