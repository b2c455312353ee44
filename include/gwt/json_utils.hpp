#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gwt {

    std::optional<std::string>    optional_string(const nlohmann::json& value);
    std::optional<std::string>    optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int>            optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<std::int64_t>   optional_int64_field(const nlohmann::json& obj, const char* key);
    std::optional<bool>           optional_bool_field(const nlohmann::json& obj, const char* key);

    // Returns nullopt instead of throwing when the text is not valid JSON.
    std::optional<nlohmann::json> parse_json_lenient(std::string_view text);

}
