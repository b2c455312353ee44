#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gwt {

    std::string_view         trim_view(std::string_view value);
    std::string              trim_copy(std::string_view value);
    std::vector<std::string> split_lines(std::string_view text);
    std::string              replace_all(std::string_view value, std::string_view from, std::string_view to);
    std::string              collapse_repeats(std::string_view value, char ch);

}
