#include "gwt/strings.hpp"

#include <cctype>

namespace gwt {

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        size_t                   start = 0;
        while (start < text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            auto line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.emplace_back(line);
            start = end + 1;
        }
        return lines;
    }

    std::string replace_all(std::string_view value, std::string_view from, std::string_view to) {
        if (from.empty()) {
            return std::string(value);
        }
        std::string output;
        output.reserve(value.size());
        size_t start = 0;
        while (true) {
            const auto pos = value.find(from, start);
            if (pos == std::string_view::npos) {
                output.append(value.substr(start));
                break;
            }
            output.append(value.substr(start, pos - start));
            output.append(to);
            start = pos + from.size();
        }
        return output;
    }

    std::string collapse_repeats(std::string_view value, char ch) {
        std::string output;
        output.reserve(value.size());
        for (const char current : value) {
            if (current == ch && !output.empty() && output.back() == ch) {
                continue;
            }
            output.push_back(current);
        }
        return output;
    }

}
