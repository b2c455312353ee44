#ifndef GWT_PROCESS_HPP
#define GWT_PROCESS_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gwt {

    struct ProcessResult {
        int         exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;

        bool        ok() const {
            return exit_code == 0;
        }
    };

    // Runs argv[0] from PATH with stdin bound to /dev/null, in a process group
    // of its own. The error side is only used when the child could not be
    // started at all.
    std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& cwd = std::nullopt);

} // namespace gwt

#endif // GWT_PROCESS_HPP
