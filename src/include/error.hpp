#pragma once

#include <string>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <crow/json.h>

namespace kcconnect {

// Error categories for classification of provider adapter failures
enum class ErrorCategory {
    IdentityProvider,         // Provider returned an explicit error payload
    EncryptionConfiguration,  // Algorithm/key configuration incomplete or unsupported
    SignatureVerification,    // Signed response failed cryptographic or claim checks
    Configuration,            // Provider configuration issues (urls, realm)
    Transport,                // HTTP failures and non-success statuses
    InvalidResponse           // Unparsable or incomplete provider responses
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;  // Underlying cause (verification error, curl error)
    std::string code;     // Provider error code, e.g. "invalid_grant"
    std::string raw;      // Full provider payload when one was received

    // Factory methods for the adapter's error taxonomy
    static Error IdentityProvider(const std::string& code,
                                  const std::string& msg,
                                  const std::string& raw) {
        return Error{ErrorCategory::IdentityProvider, msg, "", code, raw};
    }

    static Error EncryptionConfiguration(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::EncryptionConfiguration, msg, details, "", ""};
    }

    static Error SignatureVerification(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::SignatureVerification, msg, details, "", ""};
    }

    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details, "", ""};
    }

    static Error Transport(const std::string& msg, const std::string& details = "",
                           const std::string& raw = "") {
        return Error{ErrorCategory::Transport, msg, details, "", raw};
    }

    static Error InvalidResponse(const std::string& msg, const std::string& raw = "") {
        return Error{ErrorCategory::InvalidResponse, msg, "", "", raw};
    }

    // Convert error to JSON representation for diagnostics
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
// This is the Result type pattern for operations that can fail
template<typename T, typename E = Error>
class Expected {
public:
    // Constructor for value types (T && lvalue ref, excluding E type and Expected itself)
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    // Constructor for error types, only enabled when U decays to E
    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + describe());
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + describe());
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    // Moves the value out; the Expected is left holding a moved-from T
    T take() {
        return std::move(value());
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::string describe() const {
        if constexpr (std::is_same_v<E, Error>) {
            return error_.message;
        } else {
            return "error";
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Result<T> means Expected<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace kcconnect
