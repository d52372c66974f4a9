#include "include/key_formatter.hpp"

namespace kcconnect {

std::string KeyFormatter::formatPublicKey(const std::string& raw_key) {
    std::string formatted = std::string(kPemHeader) + "\n";
    formatted.reserve(formatted.size() + raw_key.size() + raw_key.size() / kLineWidth + 32);

    if (raw_key.empty()) {
        formatted += "\n";
    }

    for (size_t pos = 0; pos < raw_key.size(); pos += kLineWidth) {
        formatted += raw_key.substr(pos, kLineWidth);
        formatted += "\n";
    }

    formatted += kPemFooter;
    return formatted;
}

bool KeyFormatter::isPemFormatted(const std::string& key) {
    return key.find("-----BEGIN ") != std::string::npos;
}

} // namespace kcconnect
