#include "include/response_verifier.hpp"
#include <crow/logging.h>
#include <utility>

namespace kcconnect {

ResponseVerifier::ResponseVerifier(EncryptionSettings settings,
                                   std::shared_ptr<const TokenVerifier> verifier)
    : settings_(std::move(settings)), verifier_(std::move(verifier)) {
    if (!verifier_) {
        verifier_ = std::make_shared<JwtTokenVerifier>();
    }
}

Result<ClaimsMap> ResponseVerifier::resolve(const RawResourceOwnerResponse& response) const {
    if (const auto* claims = std::get_if<ClaimsMap>(&response)) {
        CROW_LOG_DEBUG << "Resource owner response is structured, no verification needed";
        return *claims;
    }

    return verifyEncoded(std::get<std::string>(response));
}

Result<ClaimsMap> ResponseVerifier::verifyEncoded(const std::string& token) const {
    if (!usesEncryption()) {
        CROW_LOG_WARNING << "Encoded resource owner response received but no algorithm/key is configured";
        return Error::EncryptionConfiguration(kUndeterminedEncryption);
    }

    CROW_LOG_DEBUG << "Verifying encoded resource owner response with " << settings_.algorithm
                   << " (leeway " << kLeewaySeconds << "s)";

    auto claims = verifier_->verify(token, settings_.key, settings_.algorithm, kLeewaySeconds);
    if (!claims) {
        const auto& error = claims.error();
        if (error.category == ErrorCategory::SignatureVerification) {
            return error;
        }
        return Error::SignatureVerification("Token signature verification failed", error.message);
    }

    return claims;
}

} // namespace kcconnect
