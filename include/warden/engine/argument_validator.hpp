#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace warden {
namespace engine {

/**
 * @brief Validates call parameters against a tool's JSON parameter schema.
 *
 * Checks that the parameters form an object, that every required property
 * is present and that provided properties have the declared JSON type.
 * Properties not declared in the schema are accepted.
 */
class ArgumentValidator {
public:
    /**
     * @return Empty string if valid, otherwise a description of the first violation
     */
    static std::string validate(const nlohmann::json& arguments, const nlohmann::json& schema) {
        if (!arguments.is_object()) {
            return std::string("Parameters must be an object, got ") + json_type_name(arguments);
        }
        if (!schema.is_object()) {
            return "";
        }

        auto required_it = schema.find("required");
        if (required_it != schema.end() && required_it->is_array()) {
            for (const auto& req : *required_it) {
                if (!req.is_string()) {
                    continue;
                }
                const auto& field = req.get_ref<const std::string&>();
                if (!arguments.contains(field)) {
                    return "Missing required argument: " + field;
                }
            }
        }

        auto props_it = schema.find("properties");
        if (props_it != schema.end() && props_it->is_object()) {
            for (const auto& [key, prop] : props_it->items()) {
                auto arg_it = arguments.find(key);
                if (arg_it == arguments.end()) {
                    continue;
                }
                auto type_it = prop.find("type");
                if (type_it == prop.end() || !type_it->is_string()) {
                    continue;
                }
                const auto& expected_type = type_it->get_ref<const std::string&>();
                if (!type_matches(*arg_it, expected_type)) {
                    return "Argument '" + key + "' has wrong type: expected " +
                           expected_type + ", got " + json_type_name(*arg_it);
                }
            }
        }

        return "";
    }

    static bool type_matches(const nlohmann::json& val, std::string_view expected) {
        if (expected == "integer") return val.is_number_integer();
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        if (expected == "null") return val.is_null();
        return true;
    }

    static const char* json_type_name(const nlohmann::json& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }
};

} // namespace engine
} // namespace warden
