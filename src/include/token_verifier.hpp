#pragma once

#include <string>
#include <vector>
#include <jwt-cpp/jwt.h>
#include "error.hpp"

namespace kcconnect {

// Claim name -> JSON value, as decoded by jwt-cpp (picojson traits)
using ClaimValue = picojson::value;
using ClaimsMap = picojson::object;

/**
 * Signature and time-claim verification of a compact JWS
 */
class TokenVerifier {
public:
    virtual ~TokenVerifier() = default;

    /**
     * Verify a token and return its payload claims
     * @param token Compact serialized token
     * @param key PEM public key (or shared secret for HS* algorithms)
     * @param algorithm The only algorithm the token may be signed with
     * @param leeway_seconds Clock skew tolerated on iat/nbf/exp
     * @return Claims, or a SignatureVerification error carrying the cause
     */
    virtual Result<ClaimsMap> verify(const std::string& token,
                                     const std::string& key,
                                     const std::string& algorithm,
                                     int leeway_seconds) const = 0;
};

/**
 * jwt-cpp implementation over OpenSSL
 */
class JwtTokenVerifier : public TokenVerifier {
public:
    Result<ClaimsMap> verify(const std::string& token,
                             const std::string& key,
                             const std::string& algorithm,
                             int leeway_seconds) const override;

    /**
     * RS/PS/ES 256/384/512 and HS 256/384/512
     */
    static bool isSupportedAlgorithm(const std::string& algorithm);
    static const std::vector<std::string>& supportedAlgorithms();
};

} // namespace kcconnect
