#ifndef GWT_LOGGING_HPP
#define GWT_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace gwt {

    using DebugLogSink = void (*)(std::string_view message);
    using InfoLogSink  = void (*)(std::string_view message);
    using ErrorLogSink = void (*)(std::string_view message);

    std::string format_log_entry(std::string_view context, std::string_view message);
    std::string format_debug_entry(std::string_view context, std::string_view message);
    std::string format_log_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    // Process-wide switch consulted by modules that have no Config at hand.
    void        set_debug_enabled(bool enabled);
    bool        debug_enabled();

    void        set_debug_log_sink(DebugLogSink sink);
    void        clear_debug_log_sink();
    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    void        debug_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_info_log_sink(InfoLogSink sink);
    void        clear_info_log_sink();
    void        info_log(std::string_view context, std::string_view message);

    void        set_error_log_sink(ErrorLogSink sink);
    void        clear_error_log_sink();
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        stderr_log_sink(std::string_view message);

} // namespace gwt

#endif // GWT_LOGGING_HPP
