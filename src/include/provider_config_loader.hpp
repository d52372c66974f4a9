#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>
#include "provider_config.hpp"

namespace kcconnect {

/**
 * Loads a ProviderConfig from YAML.
 *
 * Keys are read from a top-level "keycloak" section when present, otherwise
 * from the document root:
 *
 *   keycloak:
 *     auth-server-url: https://idp.example.com
 *     realm: demo
 *     client-id: portal
 *     client-secret: '{{env.KC_CLIENT_SECRET}}'
 *     redirect-uri: https://app.example.com/callback
 *     scopes: [name, email]
 *     client-authentication: basic     # or request-body (default)
 *     encryption:
 *       algorithm: RS256
 *       key-string: MIIBIjANBgkqh...   # or key: <PEM block>
 *     http:
 *       connect-timeout: 10
 *       request-timeout: 30
 *       verify-ssl: true
 *
 * String values support {{env.VAR}} substitution. Validation of the
 * resulting config is left to KeycloakProvider::create.
 */
class ProviderConfigLoader {
public:
    explicit ProviderConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * Load and parse the configuration file
     * @throws std::runtime_error if the file cannot be read, parsed or has invalid values
     */
    ProviderConfig load() const;

    /**
     * Load and parse the YAML file from disk
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    YAML::Node loadYamlFile() const;

    const std::filesystem::path& getConfigFilePath() const { return config_file_path_; }

    /**
     * Parse configuration from YAML text
     * @throws std::runtime_error on YAML syntax errors or invalid values
     */
    static ProviderConfig loadFromString(const std::string& yaml_content);

    /**
     * Build a config from an already parsed document
     * @throws std::runtime_error on invalid values
     */
    static ProviderConfig parse(const YAML::Node& root);

    /**
     * Replace {{env.VAR}} tokens; unset variables become empty strings
     */
    static std::string substituteEnvironmentVariables(const std::string& input);

private:
    std::filesystem::path config_file_path_;
};

} // namespace kcconnect
