#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "access_token.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "keycloak_endpoints.hpp"
#include "oauth2_client.hpp"
#include "provider_config.hpp"
#include "resource_owner.hpp"
#include "response_verifier.hpp"

namespace kcconnect {

/**
 * OpenID-Connect client for a Keycloak realm.
 *
 * Builds the realm endpoint URLs, runs the authorization-code and
 * refresh-token grants through the generic OAuth2 client, and resolves the
 * resource owner from the bearer credential, verifying signed responses with
 * the configured key. Holds only immutable state after creation; all calls
 * are synchronous and may run concurrently.
 */
class KeycloakProvider {
public:
    static constexpr const char* AUTHORIZATION_CODE = "authorization_code";
    static constexpr const char* REFRESH_TOKEN = "refresh_token";

    /**
     * Validate the configuration and create a provider
     * @param transport HTTP transport, libcurl with config.http when null
     * @param verifier Token verifier, jwt-cpp when null
     * @return Provider, or a Configuration / EncryptionConfiguration error
     */
    static Result<std::unique_ptr<KeycloakProvider>> create(
        const ProviderConfig& config,
        std::shared_ptr<HttpTransport> transport = nullptr,
        std::shared_ptr<const TokenVerifier> verifier = nullptr);

    // Endpoint URLs
    std::string getBaseAuthorizationUrl() const;
    std::string getBaseAccessTokenUrl() const;
    std::string getResourceOwnerDetailsUrl() const;
    std::string getLogoutUrl(const QueryParams& options = {}) const;

    /**
     * Authorization redirect for the configured server
     */
    AuthorizationRequest getAuthorizationUrl(QueryParams options = {}) const;

    /**
     * Authorization redirect on an alternate server URL (same realm), for
     * browsers that reach Keycloak under another host than this client does
     */
    AuthorizationRequest getAuthorizationUrlDocker(const std::string& url,
                                                   QueryParams options = {}) const;

    std::vector<std::string> getDefaultScopes() const;

    // Grants
    Result<AccessToken> authByCode(const std::string& code) const;
    Result<AccessToken> authByRefreshToken(const std::string& refresh_token) const;

    /**
     * Resolve the resource owner from the credential's raw token
     */
    Result<KeycloakResourceOwner> getResourceOwner(const AccessToken& token) const;

    /**
     * Resolve the resource owner from the userinfo endpoint. JSON bodies are
     * taken as claims, other bodies as signed tokens.
     */
    Result<KeycloakResourceOwner> fetchResourceOwner(const AccessToken& token) const;

    /**
     * Structured responses pass through, encoded ones are verified
     */
    Result<ClaimsMap> decryptResponse(const RawResourceOwnerResponse& response) const;

    bool usesEncryption() const;

    /**
     * Keycloak error detection: a non-empty "error" field in a JSON body
     * becomes an IdentityProvider error "<error>: <error_description>"
     */
    static std::optional<Error> checkResponse(const OAuth2Client::ParsedResponse& response);

    const ProviderConfig& config() const { return config_; }
    const KeycloakEndpoints& endpoints() const { return endpoints_; }

private:
    // Restricts construction to create()
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    KeycloakProvider(ConstructionKey,
                     const ProviderConfig& config,
                     std::shared_ptr<HttpTransport> transport,
                     std::shared_ptr<const TokenVerifier> verifier);

private:

    static RawResourceOwnerResponse classifyUserInfo(const OAuth2Client::ParsedResponse& response);

    ProviderConfig config_;
    KeycloakEndpoints endpoints_;
    OAuth2Client client_;
    ResponseVerifier verifier_;
};

} // namespace kcconnect
