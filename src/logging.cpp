#include "gwt/logging.hpp"

#include <atomic>
#include <cstdio>
#include <string>

namespace gwt {

    namespace {

        std::atomic<DebugLogSink> debug_sink{nullptr};
        std::atomic<InfoLogSink>  info_sink{nullptr};
        std::atomic<ErrorLogSink> error_sink{nullptr};
        std::atomic<bool>         debug_flag{false};

        std::string_view          basename(std::string_view path) {
            const auto slash = path.find_last_of("/\\");
            if (slash == std::string_view::npos) {
                return path;
            }
            return path.substr(slash + 1);
        }

        std::string format_entry(std::string_view prefix, std::string_view context, std::string_view message) {
            std::string text;
            text.reserve(prefix.size() + context.size() + message.size() + 8);
            text.append(prefix);
            text.push_back(' ');
            if (!context.empty()) {
                text.append(context);
                text.append(": ");
            }
            text.append(message);
            return text;
        }

        std::string format_entry_with_location(std::string_view prefix, std::string_view context, std::string_view message, const std::source_location& location) {
            auto                   text = format_entry(prefix, context, message);
            const std::string_view file = basename(location.file_name());
            text.append(" @");
            text.append(file);
            text.push_back(':');
            text.append(std::to_string(location.line()));
            return text;
        }

    } // namespace

    std::string format_log_entry(std::string_view context, std::string_view message) {
        return format_entry("[gwt]", context, message);
    }

    std::string format_debug_entry(std::string_view context, std::string_view message) {
        return format_entry("[gwt][debug]", context, message);
    }

    std::string format_log_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return format_entry_with_location("[gwt]", context, message, location);
    }

    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return format_entry_with_location("[gwt][debug]", context, message, location);
    }

    void set_debug_enabled(bool enabled) {
        debug_flag.store(enabled);
    }

    bool debug_enabled() {
        return debug_flag.load();
    }

    void set_debug_log_sink(DebugLogSink sink) {
        debug_sink.store(sink);
    }

    void clear_debug_log_sink() {
        debug_sink.store(nullptr);
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        const auto sink = debug_sink.load();
        if (!enabled || !sink) {
            return;
        }
        sink(format_debug_entry_with_location(context, message, location));
    }

    void debug_log(std::string_view context, std::string_view message, const std::source_location& location) {
        debug_log(debug_enabled(), context, message, location);
    }

    void set_info_log_sink(InfoLogSink sink) {
        info_sink.store(sink);
    }

    void clear_info_log_sink() {
        info_sink.store(nullptr);
    }

    void info_log(std::string_view context, std::string_view message) {
        const auto sink = info_sink.load();
        if (!sink) {
            return;
        }
        sink(format_log_entry(context, message));
    }

    void set_error_log_sink(ErrorLogSink sink) {
        error_sink.store(sink);
    }

    void clear_error_log_sink() {
        error_sink.store(nullptr);
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        const auto sink = error_sink.load();
        if (!sink) {
            return;
        }
        sink(format_log_entry_with_location(context, message, location));
    }

    void stderr_log_sink(std::string_view message) {
        std::fprintf(stderr, "%.*s\n", static_cast<int>(message.size()), message.data());
    }

} // namespace gwt
