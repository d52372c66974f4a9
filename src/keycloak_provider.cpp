#include "include/keycloak_provider.hpp"
#include "include/json_utils.hpp"
#include <crow/logging.h>
#include <utility>

namespace kcconnect {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

} // namespace

Result<std::unique_ptr<KeycloakProvider>> KeycloakProvider::create(
    const ProviderConfig& config,
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<const TokenVerifier> verifier) {

    if (auto error = config.validate()) {
        CROW_LOG_ERROR << "Invalid Keycloak configuration: " << error->message
                       << (error->details.empty() ? "" : " (" + error->details + ")");
        return *error;
    }

    if (!transport) {
        transport = std::make_shared<CurlHttpTransport>(config.http);
    }

    return std::make_unique<KeycloakProvider>(ConstructionKey{}, config,
                                              std::move(transport), std::move(verifier));
}

KeycloakProvider::KeycloakProvider(ConstructionKey,
                                   const ProviderConfig& config,
                                   std::shared_ptr<HttpTransport> transport,
                                   std::shared_ptr<const TokenVerifier> verifier)
    : config_(config),
      endpoints_(config.auth_server_url, config.realm),
      client_(config.clientOptions(), std::move(transport), &KeycloakProvider::checkResponse),
      verifier_(config.encryptionSettings(), std::move(verifier)) {
    CROW_LOG_INFO << "Initialized KeycloakProvider for realm '" << config_.realm
                  << "' at " << config_.auth_server_url
                  << (usesEncryption() ? " (verifying " + config_.encryption_algorithm.value_or("") + ")" : "");
}

std::string KeycloakProvider::getBaseAuthorizationUrl() const {
    return endpoints_.getBaseAuthorizationUrl();
}

std::string KeycloakProvider::getBaseAccessTokenUrl() const {
    return endpoints_.getBaseAccessTokenUrl();
}

std::string KeycloakProvider::getResourceOwnerDetailsUrl() const {
    return endpoints_.getResourceOwnerDetailsUrl();
}

std::string KeycloakProvider::getLogoutUrl(const QueryParams& options) const {
    return endpoints_.getLogoutUrl(options);
}

AuthorizationRequest KeycloakProvider::getAuthorizationUrl(QueryParams options) const {
    return client_.getAuthorizationUrl(endpoints_.getBaseAuthorizationUrl(), std::move(options));
}

AuthorizationRequest KeycloakProvider::getAuthorizationUrlDocker(const std::string& url,
                                                                 QueryParams options) const {
    return client_.getAuthorizationUrl(endpoints_.getBaseAuthorizationUrlFor(url), std::move(options));
}

std::vector<std::string> KeycloakProvider::getDefaultScopes() const {
    return ProviderConfig::defaultScopes();
}

Result<AccessToken> KeycloakProvider::authByCode(const std::string& code) const {
    return client_.getAccessToken(endpoints_.getBaseAccessTokenUrl(), AUTHORIZATION_CODE,
                                  {{"code", code}});
}

Result<AccessToken> KeycloakProvider::authByRefreshToken(const std::string& refresh_token) const {
    return client_.getAccessToken(endpoints_.getBaseAccessTokenUrl(), REFRESH_TOKEN,
                                  {{"refresh_token", refresh_token}});
}

Result<KeycloakResourceOwner> KeycloakProvider::getResourceOwner(const AccessToken& token) const {
    auto claims = decryptResponse(RawResourceOwnerResponse(token.getToken()));
    if (!claims) {
        return claims.error();
    }
    return KeycloakResourceOwner(claims.take());
}

Result<KeycloakResourceOwner> KeycloakProvider::fetchResourceOwner(const AccessToken& token) const {
    auto response = client_.getAuthenticatedResponse(endpoints_.getResourceOwnerDetailsUrl(), token);
    if (!response) {
        return response.error();
    }

    auto claims = decryptResponse(classifyUserInfo(*response));
    if (!claims) {
        return claims.error();
    }
    return KeycloakResourceOwner(claims.take());
}

Result<ClaimsMap> KeycloakProvider::decryptResponse(const RawResourceOwnerResponse& response) const {
    return verifier_.resolve(response);
}

bool KeycloakProvider::usesEncryption() const {
    return verifier_.usesEncryption();
}

std::optional<Error> KeycloakProvider::checkResponse(const OAuth2Client::ParsedResponse& response) {
    if (!response.isJsonObject()) {
        return std::nullopt;
    }

    auto error = JsonUtils::extractOptionalString(response.json, "error");
    if (!error || error->empty()) {
        return std::nullopt;
    }

    std::string description = JsonUtils::extractOptionalString(response.json, "error_description").value_or("");
    return Error::IdentityProvider(*error, *error + ": " + description, response.body);
}

RawResourceOwnerResponse KeycloakProvider::classifyUserInfo(const OAuth2Client::ParsedResponse& response) {
    if (response.isJsonObject()) {
        picojson::value value;
        std::string err = picojson::parse(value, response.body);
        if (err.empty() && value.is<picojson::object>()) {
            return value.get<picojson::object>();
        }
    }
    return trim(response.body);
}

} // namespace kcconnect
