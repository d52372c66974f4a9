#include "include/token_verifier.hpp"
#include <crow/logging.h>
#include <algorithm>

namespace kcconnect {

namespace {

// Registers exactly one algorithm; any other "alg" header is rejected by the verifier
template<typename Verifier>
void allowConfiguredAlgorithm(Verifier& verifier, const std::string& algorithm, const std::string& key) {
    if (algorithm == "RS256")
        verifier.allow_algorithm(jwt::algorithm::rs256(key, "", "", ""));
    else if (algorithm == "RS384")
        verifier.allow_algorithm(jwt::algorithm::rs384(key, "", "", ""));
    else if (algorithm == "RS512")
        verifier.allow_algorithm(jwt::algorithm::rs512(key, "", "", ""));
    else if (algorithm == "PS256")
        verifier.allow_algorithm(jwt::algorithm::ps256(key, "", "", ""));
    else if (algorithm == "PS384")
        verifier.allow_algorithm(jwt::algorithm::ps384(key, "", "", ""));
    else if (algorithm == "PS512")
        verifier.allow_algorithm(jwt::algorithm::ps512(key, "", "", ""));
    else if (algorithm == "ES256")
        verifier.allow_algorithm(jwt::algorithm::es256(key, "", "", ""));
    else if (algorithm == "ES384")
        verifier.allow_algorithm(jwt::algorithm::es384(key, "", "", ""));
    else if (algorithm == "ES512")
        verifier.allow_algorithm(jwt::algorithm::es512(key, "", "", ""));
    else if (algorithm == "HS256")
        verifier.allow_algorithm(jwt::algorithm::hs256(key));
    else if (algorithm == "HS384")
        verifier.allow_algorithm(jwt::algorithm::hs384(key));
    else if (algorithm == "HS512")
        verifier.allow_algorithm(jwt::algorithm::hs512(key));
    else
        throw std::invalid_argument("Unsupported signature algorithm: " + algorithm);
}

} // namespace

const std::vector<std::string>& JwtTokenVerifier::supportedAlgorithms() {
    static const std::vector<std::string> algorithms = {
        "RS256", "RS384", "RS512",
        "PS256", "PS384", "PS512",
        "ES256", "ES384", "ES512",
        "HS256", "HS384", "HS512"
    };
    return algorithms;
}

bool JwtTokenVerifier::isSupportedAlgorithm(const std::string& algorithm) {
    const auto& algorithms = supportedAlgorithms();
    return std::find(algorithms.begin(), algorithms.end(), algorithm) != algorithms.end();
}

Result<ClaimsMap> JwtTokenVerifier::verify(const std::string& token,
                                           const std::string& key,
                                           const std::string& algorithm,
                                           int leeway_seconds) const {
    try {
        auto decoded = jwt::decode(token);

        auto verifier = jwt::verify()
            .leeway(static_cast<size_t>(leeway_seconds));
        allowConfiguredAlgorithm(verifier, algorithm, key);

        verifier.verify(decoded);

        ClaimsMap claims = decoded.get_payload_json();
        CROW_LOG_DEBUG << "Token verified with " << algorithm << ", " << claims.size() << " claims";
        return claims;

    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "Token verification failed: " << e.what();
        return Error::SignatureVerification("Token signature verification failed", e.what());
    }
}

} // namespace kcconnect
