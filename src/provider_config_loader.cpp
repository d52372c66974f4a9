#include "include/provider_config_loader.hpp"
#include "include/key_formatter.hpp"
#include <crow/logging.h>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace kcconnect {

namespace {

std::string readString(const YAML::Node& node, const std::string& key, const std::string& fallback = "") {
    if (!node[key]) {
        return fallback;
    }
    return ProviderConfigLoader::substituteEnvironmentVariables(node[key].as<std::string>());
}

ClientAuthMethod parseClientAuthMethod(const std::string& value) {
    if (value.empty() || value == "request-body" || value == "client_secret_post") {
        return ClientAuthMethod::RequestBody;
    }
    if (value == "basic" || value == "client_secret_basic") {
        return ClientAuthMethod::BasicHeader;
    }
    throw std::runtime_error("Invalid client-authentication '" + value +
                             "', expected 'request-body' or 'basic'");
}

} // namespace

ProviderConfigLoader::ProviderConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(std::filesystem::absolute(config_file_path)) {
    CROW_LOG_DEBUG << "ProviderConfigLoader initialized with config file: " << config_file_path_.string();
}

YAML::Node ProviderConfigLoader::loadYamlFile() const {
    if (!std::filesystem::exists(config_file_path_)) {
        throw std::runtime_error("Configuration file not found: " + config_file_path_.string());
    }

    try {
        CROW_LOG_DEBUG << "Loading YAML file: " << config_file_path_.string();
        return YAML::LoadFile(config_file_path_.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + config_file_path_.string() + "': " + e.what());
    }
}

ProviderConfig ProviderConfigLoader::load() const {
    return parse(loadYamlFile());
}

ProviderConfig ProviderConfigLoader::loadFromString(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse YAML configuration: ") + e.what());
    }
    return parse(root);
}

ProviderConfig ProviderConfigLoader::parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid Keycloak configuration: expected a mapping");
    }

    const YAML::Node node = root["keycloak"] ? root["keycloak"] : root;
    ProviderConfig config;

    try {
        config.auth_server_url = readString(node, "auth-server-url");
        config.realm = readString(node, "realm");
        config.client_id = readString(node, "client-id");
        config.client_secret = readString(node, "client-secret");
        config.redirect_uri = readString(node, "redirect-uri");
        config.scope_separator = readString(node, "scope-separator", config.scope_separator);
        config.client_auth = parseClientAuthMethod(readString(node, "client-authentication"));

        if (node["scopes"]) {
            config.scopes.clear();
            for (const auto& scope : node["scopes"]) {
                config.scopes.push_back(substituteEnvironmentVariables(scope.as<std::string>()));
            }
        }

        if (auto encryption = node["encryption"]) {
            std::string algorithm = readString(encryption, "algorithm");
            if (!algorithm.empty()) {
                config.encryption_algorithm = algorithm;
            }

            if (encryption["key"] && encryption["key-string"]) {
                throw std::runtime_error("encryption.key and encryption.key-string are mutually exclusive");
            }

            std::string key = readString(encryption, "key");
            std::string key_string = readString(encryption, "key-string");
            if (!key.empty()) {
                config.encryption_key = KeyFormatter::isPemFormatted(key)
                    ? key
                    : KeyFormatter::formatPublicKey(key);
            } else if (!key_string.empty()) {
                config.setEncryptionKeyString(key_string);
            }
        }

        if (auto http = node["http"]) {
            if (http["connect-timeout"]) {
                config.http.connect_timeout_seconds = http["connect-timeout"].as<int>();
            }
            if (http["request-timeout"]) {
                config.http.request_timeout_seconds = http["request-timeout"].as<int>();
            }
            if (http["verify-ssl"]) {
                config.http.verify_ssl = http["verify-ssl"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid Keycloak configuration: ") + e.what());
    }

    CROW_LOG_DEBUG << "Keycloak configuration: server=" << config.auth_server_url
                   << ", realm=" << config.realm
                   << ", client-id=" << config.client_id
                   << ", client-secret=*****[" << config.client_secret.length() << "]"
                   << ", encryption=" << config.encryption_algorithm.value_or("none");
    return config;
}

std::string ProviderConfigLoader::substituteEnvironmentVariables(const std::string& input) {
    static const std::regex env_regex(R"(\{\{env\.([A-Za-z_][A-Za-z0-9_]*)\}\})");

    std::string result;
    auto last = input.cbegin();
    for (auto it = std::sregex_iterator(input.begin(), input.end(), env_regex);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        result.append(last, match[0].first);

        const char* env_value = std::getenv(match.str(1).c_str());
        if (env_value) {
            result += env_value;
        } else {
            CROW_LOG_WARNING << "Environment variable not set: " << match.str(1);
        }
        last = match[0].second;
    }
    result.append(last, input.cend());
    return result;
}

} // namespace kcconnect
