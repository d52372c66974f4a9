#pragma once

#include <optional>
#include <string>
#include <vector>
#include "token_verifier.hpp"

namespace kcconnect {

/**
 * Identity of the authenticated Keycloak user, read from verified claims.
 * Missing claims surface as empty optionals or empty lists.
 */
class KeycloakResourceOwner {
public:
    explicit KeycloakResourceOwner(ClaimsMap claims);

    std::optional<std::string> getId() const;                 // sub
    std::optional<std::string> getName() const;               // name
    std::optional<std::string> getEmail() const;              // email
    std::optional<std::string> getPreferredUsername() const;  // preferred_username
    std::optional<std::string> getGivenName() const;          // given_name
    std::optional<std::string> getFamilyName() const;         // family_name

    bool isEmailVerified() const;

    // realm_access.roles
    std::vector<std::string> getRealmRoles() const;

    // resource_access.<client_id>.roles
    std::vector<std::string> getClientRoles(const std::string& client_id) const;

    /**
     * Claim lookup by dotted path, e.g. "address.country"
     */
    std::optional<ClaimValue> getClaim(const std::string& claim_path) const;

    /**
     * String claim by dotted path; non-string values yield nullopt
     */
    std::optional<std::string> getStringClaim(const std::string& claim_path) const;

    const ClaimsMap& toArray() const { return claims_; }

private:
    static std::vector<std::string> stringList(const ClaimValue& value);

    ClaimsMap claims_;
};

} // namespace kcconnect
