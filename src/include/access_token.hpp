#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <crow/json.h>
#include "error.hpp"

namespace kcconnect {

/**
 * Bearer credential returned by the token endpoint.
 * Read-only once parsed; the raw access token is passed on as-is.
 */
struct AccessToken {
    // expires_in is clamped to [0, ten years] before computing the expiry
    static constexpr int64_t kMaxExpiresInSeconds = 10LL * 365 * 24 * 60 * 60;

    std::string access_token;
    std::optional<std::string> refresh_token;
    std::optional<std::chrono::system_clock::time_point> expires;
    std::string token_type = "Bearer";
    std::string scope;
    std::optional<std::string> id_token;
    std::optional<std::string> resource_owner_id;

    // Remaining scalar fields (e.g. refresh_expires_in, session_state)
    std::map<std::string, std::string> values;

    const std::string& getToken() const { return access_token; }

    /**
     * True only when an expiry is known and lies in the past
     */
    bool hasExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /**
     * Build a token from a parsed token endpoint response
     * @param json Response object
     * @param raw Response body, kept for diagnostics
     * @param now Reference time for expires_in
     */
    static Result<AccessToken> fromJson(
        const crow::json::rvalue& json,
        const std::string& raw,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
};

} // namespace kcconnect
