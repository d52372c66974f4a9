#include "include/keycloak_endpoints.hpp"

#include <utility>

namespace kcconnect {

KeycloakEndpoints::KeycloakEndpoints(std::string auth_server_url, std::string realm)
    : auth_server_url_(std::move(auth_server_url)), realm_(std::move(realm)) {}

std::string KeycloakEndpoints::realmBaseFor(const std::string& server_url) const {
    return server_url + "/realms/" + realm_;
}

std::string KeycloakEndpoints::getIdentityProviderBaseUrl() const {
    return realmBaseFor(auth_server_url_);
}

std::string KeycloakEndpoints::getBaseAuthorizationUrl() const {
    return getIdentityProviderBaseUrl() + kAuthPath;
}

std::string KeycloakEndpoints::getBaseAccessTokenUrl() const {
    return getIdentityProviderBaseUrl() + kTokenPath;
}

std::string KeycloakEndpoints::getResourceOwnerDetailsUrl() const {
    return getIdentityProviderBaseUrl() + kUserInfoPath;
}

std::string KeycloakEndpoints::getBaseLogoutUrl() const {
    return getIdentityProviderBaseUrl() + kLogoutPath;
}

std::string KeycloakEndpoints::getLogoutUrl(const QueryParams& options) const {
    return UrlUtils::appendQuery(getBaseLogoutUrl(), UrlUtils::buildQuery(options));
}

std::string KeycloakEndpoints::getBaseAuthorizationUrlFor(const std::string& server_url) const {
    return realmBaseFor(server_url) + kAuthPath;
}

} // namespace kcconnect
