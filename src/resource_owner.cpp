#include "include/resource_owner.hpp"
#include <utility>

namespace kcconnect {

KeycloakResourceOwner::KeycloakResourceOwner(ClaimsMap claims)
    : claims_(std::move(claims)) {}

std::optional<std::string> KeycloakResourceOwner::getId() const {
    return getStringClaim("sub");
}

std::optional<std::string> KeycloakResourceOwner::getName() const {
    return getStringClaim("name");
}

std::optional<std::string> KeycloakResourceOwner::getEmail() const {
    return getStringClaim("email");
}

std::optional<std::string> KeycloakResourceOwner::getPreferredUsername() const {
    return getStringClaim("preferred_username");
}

std::optional<std::string> KeycloakResourceOwner::getGivenName() const {
    return getStringClaim("given_name");
}

std::optional<std::string> KeycloakResourceOwner::getFamilyName() const {
    return getStringClaim("family_name");
}

bool KeycloakResourceOwner::isEmailVerified() const {
    auto value = getClaim("email_verified");
    return value && value->is<bool>() && value->get<bool>();
}

std::vector<std::string> KeycloakResourceOwner::getRealmRoles() const {
    auto roles = getClaim("realm_access.roles");
    return roles ? stringList(*roles) : std::vector<std::string>{};
}

std::vector<std::string> KeycloakResourceOwner::getClientRoles(const std::string& client_id) const {
    // Client ids may contain dots, so walk the objects instead of using a path
    auto it = claims_.find("resource_access");
    if (it == claims_.end() || !it->second.is<picojson::object>()) {
        return {};
    }

    const auto& clients = it->second.get<picojson::object>();
    auto client = clients.find(client_id);
    if (client == clients.end() || !client->second.is<picojson::object>()) {
        return {};
    }

    const auto& access = client->second.get<picojson::object>();
    auto roles = access.find("roles");
    return roles != access.end() ? stringList(roles->second) : std::vector<std::string>{};
}

std::optional<ClaimValue> KeycloakResourceOwner::getClaim(const std::string& claim_path) const {
    const ClaimsMap* current = &claims_;
    size_t start = 0;

    while (true) {
        size_t dot_pos = claim_path.find('.', start);
        std::string segment = claim_path.substr(start, dot_pos == std::string::npos ? std::string::npos
                                                                                     : dot_pos - start);
        auto it = current->find(segment);
        if (it == current->end()) {
            return std::nullopt;
        }

        if (dot_pos == std::string::npos) {
            return it->second;
        }

        if (!it->second.is<picojson::object>()) {
            return std::nullopt;
        }
        current = &it->second.get<picojson::object>();
        start = dot_pos + 1;
    }
}

std::optional<std::string> KeycloakResourceOwner::getStringClaim(const std::string& claim_path) const {
    auto value = getClaim(claim_path);
    if (!value || !value->is<std::string>()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::vector<std::string> KeycloakResourceOwner::stringList(const ClaimValue& value) {
    std::vector<std::string> result;

    if (value.is<picojson::array>()) {
        for (const auto& item : value.get<picojson::array>()) {
            if (item.is<std::string>()) {
                result.push_back(item.get<std::string>());
            }
        }
    } else if (value.is<std::string>()) {
        // Single value treated as array of one
        result.push_back(value.get<std::string>());
    }

    return result;
}

} // namespace kcconnect
