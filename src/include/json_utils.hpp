#pragma once

#include <crow/json.h>
#include <cstdint>
#include <limits>
#include <string>
#include <optional>

namespace kcconnect {

/**
 * Safe field extraction from provider JSON responses.
 * Missing keys and wrong types yield nullopt instead of throwing.
 */
class JsonUtils {
public:
    /**
     * True if the value was parsed successfully and is a JSON object
     */
    static bool isObject(const crow::json::rvalue& value) {
        return static_cast<bool>(value) && value.t() == crow::json::type::Object;
    }

    /**
     * Extract string from JSON value, or empty string if value is not a string
     */
    static std::string extractString(const crow::json::rvalue& value) {
        if (value.t() != crow::json::type::String) {
            return "";
        }
        return std::string(value.s());
    }

    /**
     * Extract optional string from JSON object by key.
     * Returns nullopt if key is missing or value is not a string.
     */
    static std::optional<std::string> extractOptionalString(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!json.has(key)) {
            return std::nullopt;
        }

        auto value = json[key];
        if (value.t() != crow::json::type::String) {
            return std::nullopt;
        }

        return extractString(value);
    }

    /**
     * Extract integer from JSON object by key.
     * Numeric strings are accepted, some providers quote expires_in.
     * Fractional numbers and values outside int64_t yield nullopt.
     */
    static std::optional<int64_t> extractInt(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!json.has(key)) {
            return std::nullopt;
        }

        auto value = json[key];
        if (value.t() == crow::json::type::Number) {
            switch (value.nt()) {
                case crow::json::num_type::Signed_integer:
                    return value.i();
                case crow::json::num_type::Unsigned_integer:
                    if (value.u() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        return static_cast<int64_t>(value.u());
                    }
                    return std::nullopt;
                default:
                    return std::nullopt;
            }
        }

        if (value.t() == crow::json::type::String) {
            try {
                size_t consumed = 0;
                std::string text = extractString(value);
                int64_t parsed = std::stoll(text, &consumed);
                if (consumed == text.size()) {
                    return parsed;
                }
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }

        return std::nullopt;
    }

    /**
     * Convert a scalar JSON value to its string form.
     * Objects, arrays and null yield an empty string.
     */
    static std::string valueToString(const crow::json::rvalue& value) {
        switch (value.t()) {
            case crow::json::type::String:
                return extractString(value);
            case crow::json::type::Number:
                if (value.nt() == crow::json::num_type::Floating_point) {
                    return std::to_string(value.d());
                }
                return std::to_string(value.i());
            case crow::json::type::True:
                return "true";
            case crow::json::type::False:
                return "false";
            default:
                return "";
        }
    }
};

} // namespace kcconnect
