#pragma once

#include <string>
#include "url_utils.hpp"

namespace kcconnect {

/**
 * Derives the realm-scoped OpenID-Connect endpoint URLs of a Keycloak server.
 * Example: https://idp.example.com + demo ->
 *          https://idp.example.com/realms/demo/protocol/openid-connect/token
 *
 * URLs are not validated; a malformed server URL yields a malformed endpoint.
 */
class KeycloakEndpoints {
public:
    static constexpr const char* kAuthPath = "/protocol/openid-connect/auth";
    static constexpr const char* kTokenPath = "/protocol/openid-connect/token";
    static constexpr const char* kUserInfoPath = "/protocol/openid-connect/userinfo";
    static constexpr const char* kLogoutPath = "/protocol/openid-connect/logout";

    KeycloakEndpoints(std::string auth_server_url, std::string realm);

    /**
     * Realm base URL, which is also the issuer of realm tokens
     */
    std::string getIdentityProviderBaseUrl() const;

    std::string getBaseAuthorizationUrl() const;
    std::string getBaseAccessTokenUrl() const;
    std::string getResourceOwnerDetailsUrl() const;
    std::string getBaseLogoutUrl() const;

    /**
     * Logout URL with the caller's parameters (e.g. redirect_uri, id_token_hint)
     * appended as an RFC 3986 encoded query. No parameters are added.
     */
    std::string getLogoutUrl(const QueryParams& options = {}) const;

    /**
     * Authorization endpoint on an alternate server URL, for clients that reach
     * the provider under a different host name (docker networks)
     */
    std::string getBaseAuthorizationUrlFor(const std::string& server_url) const;

    const std::string& getAuthServerUrl() const { return auth_server_url_; }
    const std::string& getRealm() const { return realm_; }

private:
    std::string realmBaseFor(const std::string& server_url) const;

    std::string auth_server_url_;
    std::string realm_;
};

} // namespace kcconnect
