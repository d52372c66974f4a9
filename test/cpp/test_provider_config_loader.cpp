#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "provider_config_loader.hpp"
#include "keycloak_provider.hpp"
#include "test_utils.hpp"

using namespace kcconnect;
using namespace kcconnect::test;

TEST_CASE("ProviderConfigLoader::loadFromString", "[config]") {
    SECTION("Full keycloak section") {
        auto config = ProviderConfigLoader::loadFromString(R"(
keycloak:
  auth-server-url: https://idp.example.com
  realm: demo
  client-id: portal
  client-secret: s3cr3t
  redirect-uri: https://app.example.com/callback
  scopes: [openid, email]
  scope-separator: " "
  client-authentication: basic
  http:
    connect-timeout: 3
    request-timeout: 7
    verify-ssl: false
)");

        REQUIRE(config.auth_server_url == "https://idp.example.com");
        REQUIRE(config.realm == "demo");
        REQUIRE(config.client_id == "portal");
        REQUIRE(config.client_secret == "s3cr3t");
        REQUIRE(config.redirect_uri == "https://app.example.com/callback");
        REQUIRE(config.scopes == std::vector<std::string>{"openid", "email"});
        REQUIRE(config.scope_separator == " ");
        REQUIRE(config.client_auth == ClientAuthMethod::BasicHeader);
        REQUIRE(config.http.connect_timeout_seconds == 3);
        REQUIRE(config.http.request_timeout_seconds == 7);
        REQUIRE_FALSE(config.http.verify_ssl);
        REQUIRE_FALSE(config.encryption_algorithm.has_value());
        REQUIRE_FALSE(config.validate().has_value());
    }

    SECTION("Keys at the document root use defaults") {
        auto config = ProviderConfigLoader::loadFromString(R"(
auth-server-url: http://localhost:8080
realm: master
)");

        REQUIRE(config.realm == "master");
        REQUIRE(config.scopes == ProviderConfig::defaultScopes());
        REQUIRE(config.scope_separator == ",");
        REQUIRE(config.client_auth == ClientAuthMethod::RequestBody);
        REQUIRE(config.http.connect_timeout_seconds == 10);
        REQUIRE(config.http.request_timeout_seconds == 30);
        REQUIRE(config.http.verify_ssl);
    }

    SECTION("Invalid client authentication") {
        REQUIRE_THROWS_WITH(ProviderConfigLoader::loadFromString(R"(
realm: demo
client-authentication: private_key_jwt
)"), Catch::Matchers::ContainsSubstring("client-authentication"));
    }

    SECTION("Invalid timeout value") {
        REQUIRE_THROWS_AS(ProviderConfigLoader::loadFromString(R"(
realm: demo
http:
  connect-timeout: soon
)"), std::runtime_error);
    }

    SECTION("Malformed YAML") {
        REQUIRE_THROWS_AS(ProviderConfigLoader::loadFromString("realm: [unclosed"), std::runtime_error);
    }

    SECTION("Scalar document") {
        REQUIRE_THROWS_AS(ProviderConfigLoader::loadFromString("just text"), std::runtime_error);
    }
}

TEST_CASE("ProviderConfigLoader encryption settings", "[config][key]") {
    const auto& keys = realmKeys();

    SECTION("Bare key string is formatted") {
        auto config = ProviderConfigLoader::loadFromString(
            "realm: demo\nauth-server-url: https://idp\nencryption:\n  algorithm: RS256\n  key-string: " +
            stripPemArmor(keys.public_pem) + "\n");

        REQUIRE(config.encryption_algorithm == std::optional<std::string>("RS256"));
        REQUIRE(config.encryption_key.has_value());
        REQUIRE(*config.encryption_key + "\n" == keys.public_pem);
        REQUIRE_FALSE(config.validate().has_value());
    }

    SECTION("PEM key is kept as-is") {
        std::string yaml = "realm: demo\nauth-server-url: https://idp\nencryption:\n  algorithm: RS256\n  key: |\n";
        std::string line;
        for (char c : keys.public_pem) {
            if (c == '\n') {
                yaml += "    " + line + "\n";
                line.clear();
            } else {
                line += c;
            }
        }

        auto config = ProviderConfigLoader::loadFromString(yaml);

        REQUIRE(config.encryption_key == std::optional<std::string>(keys.public_pem));
    }

    SECTION("Key and key-string together") {
        REQUIRE_THROWS_WITH(ProviderConfigLoader::loadFromString(R"(
realm: demo
encryption:
  algorithm: RS256
  key: abc
  key-string: def
)"), Catch::Matchers::ContainsSubstring("mutually exclusive"));
    }

    SECTION("Algorithm alone is loaded and rejected on validation") {
        auto config = ProviderConfigLoader::loadFromString(R"(
realm: demo
auth-server-url: https://idp
encryption:
  algorithm: RS256
)");

        auto error = config.validate();
        REQUIRE(error.has_value());
        REQUIRE(error->category == ErrorCategory::EncryptionConfiguration);
    }
}

TEST_CASE("ProviderConfigLoader environment variables", "[config][env]") {
    SECTION("Substitutes set variables") {
        ScopedEnvVar secret("KCCONNECT_TEST_SECRET", "from-env");
        ScopedEnvVar host("KCCONNECT_TEST_HOST", "idp.internal");

        auto config = ProviderConfigLoader::loadFromString(R"(
keycloak:
  auth-server-url: 'https://{{env.KCCONNECT_TEST_HOST}}:8443'
  realm: demo
  client-secret: '{{env.KCCONNECT_TEST_SECRET}}'
)");

        REQUIRE(config.auth_server_url == "https://idp.internal:8443");
        REQUIRE(config.client_secret == "from-env");
    }

    SECTION("Unset variables become empty") {
        REQUIRE(ProviderConfigLoader::substituteEnvironmentVariables(
                    "a{{env.KCCONNECT_TEST_UNSET_VARIABLE}}b") == "ab");
    }

    SECTION("Text without tokens is unchanged") {
        REQUIRE(ProviderConfigLoader::substituteEnvironmentVariables("{{ not a token }}") ==
                "{{ not a token }}");
    }
}

TEST_CASE("ProviderConfigLoader::load", "[config][file]") {
    SECTION("Reads the file") {
        TempFile file(R"(
keycloak:
  auth-server-url: https://idp.example.com
  realm: demo
  client-id: portal
)");

        ProviderConfigLoader loader(file.path());
        auto config = loader.load();

        REQUIRE(config.client_id == "portal");
        REQUIRE(loader.getConfigFilePath().is_absolute());

        auto provider = KeycloakProvider::create(config, std::make_shared<MockHttpTransport>());
        REQUIRE(provider.has_value());
        REQUIRE((*provider)->getBaseAccessTokenUrl() ==
                "https://idp.example.com/realms/demo/protocol/openid-connect/token");
    }

    SECTION("Missing file") {
        ProviderConfigLoader loader("/nonexistent/kcconnect/keycloak.yaml");

        REQUIRE_THROWS_WITH(loader.load(), Catch::Matchers::ContainsSubstring("Configuration file not found"));
    }
}

TEST_CASE("ProviderConfig helpers", "[config]") {
    auto config = demoConfig();

    SECTION("Client options carry the configured values") {
        config.scopes.clear();
        auto options = config.clientOptions();

        REQUIRE(options.client_id == "portal");
        REQUIRE(options.client_secret == "s3cr3t");
        REQUIRE(options.scopes == ProviderConfig::defaultScopes());
    }

    SECTION("Encryption settings") {
        REQUIRE_FALSE(config.encryptionSettings().usesEncryption());

        config.encryption_algorithm = "RS256";
        config.setEncryptionKeyString("abc");

        auto settings = config.encryptionSettings();
        REQUIRE(settings.usesEncryption());
        REQUIRE(settings.algorithm == "RS256");
        REQUIRE(settings.key == "-----BEGIN PUBLIC KEY-----\nabc\n-----END PUBLIC KEY-----");
    }
}
