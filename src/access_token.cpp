#include "include/access_token.hpp"
#include "include/json_utils.hpp"
#include <crow/logging.h>
#include <algorithm>

namespace kcconnect {

bool AccessToken::hasExpired(std::chrono::system_clock::time_point now) const {
    return expires.has_value() && *expires <= now;
}

Result<AccessToken> AccessToken::fromJson(
    const crow::json::rvalue& json,
    const std::string& raw,
    std::chrono::system_clock::time_point now) {

    if (!JsonUtils::isObject(json)) {
        return Error::InvalidResponse("Token response is not a JSON object", raw);
    }

    auto access_token = JsonUtils::extractOptionalString(json, "access_token");
    if (!access_token || access_token->empty()) {
        return Error::InvalidResponse("Required option not passed: \"access_token\"", raw);
    }

    AccessToken token;
    token.access_token = *access_token;
    token.refresh_token = JsonUtils::extractOptionalString(json, "refresh_token");
    token.id_token = JsonUtils::extractOptionalString(json, "id_token");

    if (auto token_type = JsonUtils::extractOptionalString(json, "token_type")) {
        token.token_type = *token_type;
    }

    if (auto scope = JsonUtils::extractOptionalString(json, "scope")) {
        token.scope = *scope;
    }

    if (auto expires_in = JsonUtils::extractInt(json, "expires_in")) {
        int64_t lifetime = std::clamp<int64_t>(*expires_in, 0, kMaxExpiresInSeconds);
        if (lifetime != *expires_in) {
            CROW_LOG_WARNING << "Token expires_in " << *expires_in << " out of range, using " << lifetime;
        }
        token.expires = now + std::chrono::seconds(lifetime);
    }

    // Keycloak puts the subject in the id token, but some proxies add it here
    if (auto sub = JsonUtils::extractOptionalString(json, "sub")) {
        token.resource_owner_id = *sub;
    }

    for (const auto& field : json) {
        const std::string key = field.key();
        if (key == "access_token" || key == "refresh_token" || key == "id_token" ||
            key == "token_type" || key == "scope" || key == "expires_in") {
            continue;
        }
        if (field.t() == crow::json::type::Object || field.t() == crow::json::type::List ||
            field.t() == crow::json::type::Null) {
            continue;
        }
        token.values[key] = JsonUtils::valueToString(field);
    }

    CROW_LOG_DEBUG << "Parsed access token: *****[" << token.access_token.size() << "]"
                   << ", refresh token: " << (token.refresh_token ? "yes" : "no")
                   << ", expires_in: " << (token.expires ? "set" : "unset");
    return token;
}

} // namespace kcconnect
