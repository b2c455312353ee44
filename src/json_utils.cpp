#include "gwt/json_utils.hpp"

namespace gwt {

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (value.is_null()) {
            return std::nullopt;
        }
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto str = value.get<std::string>();
        if (str.empty()) {
            return std::nullopt;
        }
        return str;
    }

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        return optional_string(obj.at(key));
    }

    std::optional<int> optional_int_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_number_integer()) {
            return std::nullopt;
        }
        return obj.at(key).get<int>();
    }

    std::optional<std::int64_t> optional_int64_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_number_integer()) {
            return std::nullopt;
        }
        return obj.at(key).get<std::int64_t>();
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

    std::optional<nlohmann::json> parse_json_lenient(std::string_view text) {
        auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (parsed.is_discarded()) {
            return std::nullopt;
        }
        return parsed;
    }

}
