#pragma once

#include <memory>
#include <string>
#include <variant>
#include "error.hpp"
#include "token_verifier.hpp"

namespace kcconnect {

/**
 * Resource-owner response as received: an encoded (signed) token string or
 * an already structured claims map
 */
using RawResourceOwnerResponse = std::variant<std::string, ClaimsMap>;

/**
 * Algorithm and key used to verify encoded responses
 */
struct EncryptionSettings {
    std::string algorithm;
    std::string key;  // PEM public key, or shared secret for HS*

    /**
     * Both algorithm and key are non-empty
     */
    bool usesEncryption() const { return !algorithm.empty() && !key.empty(); }
};

/**
 * Single policy point deciding how a resource-owner response becomes claims.
 *
 * Structured maps pass through untouched. Strings are treated as signed
 * tokens and must verify against the configured key using exactly the
 * configured algorithm, with kLeewaySeconds of clock skew on time claims.
 * Without a complete configuration a string is rejected and no verification
 * is attempted.
 */
class ResponseVerifier {
public:
    static constexpr int kLeewaySeconds = 5;
    static constexpr const char* kUndeterminedEncryption = "undetermined encryption";

    explicit ResponseVerifier(EncryptionSettings settings,
                              std::shared_ptr<const TokenVerifier> verifier = nullptr);

    Result<ClaimsMap> resolve(const RawResourceOwnerResponse& response) const;

    bool usesEncryption() const { return settings_.usesEncryption(); }
    const EncryptionSettings& settings() const { return settings_; }

private:
    Result<ClaimsMap> verifyEncoded(const std::string& token) const;

    EncryptionSettings settings_;
    std::shared_ptr<const TokenVerifier> verifier_;
};

} // namespace kcconnect
