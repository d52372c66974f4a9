#include "include/provider_config.hpp"
#include "include/key_formatter.hpp"
#include "include/token_verifier.hpp"

namespace kcconnect {

void ProviderConfig::setEncryptionKeyString(const std::string& raw_key) {
    encryption_key = KeyFormatter::formatPublicKey(raw_key);
}

std::optional<Error> ProviderConfig::validate() const {
    if (auth_server_url.empty()) {
        return Error::Config("Missing auth server url", "auth-server-url is required");
    }

    if (realm.empty()) {
        return Error::Config("Missing realm", "realm is required");
    }

    bool has_algorithm = encryption_algorithm && !encryption_algorithm->empty();
    bool has_key = encryption_key && !encryption_key->empty();

    if (has_algorithm != has_key) {
        return Error::EncryptionConfiguration(
            "Incomplete encryption configuration",
            has_algorithm ? "encryption algorithm set without a key"
                          : "encryption key set without an algorithm");
    }

    if (has_algorithm && !JwtTokenVerifier::isSupportedAlgorithm(*encryption_algorithm)) {
        return Error::EncryptionConfiguration(
            "Unsupported encryption algorithm", *encryption_algorithm);
    }

    return std::nullopt;
}

EncryptionSettings ProviderConfig::encryptionSettings() const {
    EncryptionSettings settings;
    settings.algorithm = encryption_algorithm.value_or("");
    settings.key = encryption_key.value_or("");
    return settings;
}

OAuth2Client::Options ProviderConfig::clientOptions() const {
    OAuth2Client::Options options;
    options.client_id = client_id;
    options.client_secret = client_secret;
    options.redirect_uri = redirect_uri;
    options.scopes = scopes.empty() ? defaultScopes() : scopes;
    options.scope_separator = scope_separator;
    options.client_auth = client_auth;
    return options;
}

} // namespace kcconnect
