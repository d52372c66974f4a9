#pragma once

#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "http_client.hpp"
#include "oauth2_client.hpp"
#include "response_verifier.hpp"

namespace kcconnect {

/**
 * Keycloak client configuration. Read-only once a provider is created.
 */
struct ProviderConfig {
    std::string auth_server_url;   // e.g. https://idp.example.com (no trailing slash)
    std::string realm;
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri;
    std::vector<std::string> scopes = defaultScopes();
    std::string scope_separator = ",";
    ClientAuthMethod client_auth = ClientAuthMethod::RequestBody;

    // Set both or neither
    std::optional<std::string> encryption_algorithm;
    std::optional<std::string> encryption_key;  // PEM formatted

    HTTPClient::Options http;

    /**
     * Scopes requested when none are configured: name, email
     */
    static std::vector<std::string> defaultScopes() { return {"name", "email"}; }

    /**
     * Store a bare base64 key (as shown in the realm keys tab) in PEM form
     */
    void setEncryptionKeyString(const std::string& raw_key);

    /**
     * Check required fields and that the encryption settings are complete
     * and use a supported algorithm
     * @return Error if invalid, nullopt otherwise
     */
    std::optional<Error> validate() const;

    EncryptionSettings encryptionSettings() const;
    OAuth2Client::Options clientOptions() const;
};

} // namespace kcconnect
