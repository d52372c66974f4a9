#pragma once

#include <string>

namespace kcconnect {

/**
 * Turns the bare base64 public key shown by the Keycloak realm settings
 * into a PEM block that OpenSSL can read.
 */
class KeyFormatter {
public:
    static constexpr size_t kLineWidth = 64;
    static constexpr const char* kPemHeader = "-----BEGIN PUBLIC KEY-----";
    static constexpr const char* kPemFooter = "-----END PUBLIC KEY-----";

    /**
     * Wrap raw key material at 64 characters per line between the PEM markers.
     * Every body line ends with '\n'; nothing follows the footer.
     * The input is not validated, bad material fails later at verification.
     */
    static std::string formatPublicKey(const std::string& raw_key);

    /**
     * True if the key already carries a PEM BEGIN marker
     */
    static bool isPemFormatted(const std::string& key);
};

} // namespace kcconnect
