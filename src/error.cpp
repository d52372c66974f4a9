#include "include/error.hpp"

namespace kcconnect {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::IdentityProvider:
            return "IdentityProvider";
        case ErrorCategory::EncryptionConfiguration:
            return "EncryptionConfiguration";
        case ErrorCategory::SignatureVerification:
            return "SignatureVerification";
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Transport:
            return "Transport";
        case ErrorCategory::InvalidResponse:
            return "InvalidResponse";
        default:
            return "Unknown";
    }
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;

    if (!code.empty()) {
        error_json["error"]["code"] = code;
    }

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    if (!raw.empty()) {
        error_json["error"]["raw"] = raw;
    }

    return error_json;
}

} // namespace kcconnect
