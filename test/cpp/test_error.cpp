#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "error.hpp"

#include <memory>

using namespace kcconnect;

TEST_CASE("Error construction", "[error]") {
    SECTION("Identity provider error") {
        auto err = Error::IdentityProvider("invalid_grant", "invalid_grant: bad code",
                                           R"({"error":"invalid_grant"})");
        REQUIRE(err.category == ErrorCategory::IdentityProvider);
        REQUIRE(err.code == "invalid_grant");
        REQUIRE(err.message == "invalid_grant: bad code");
        REQUIRE(err.raw == R"({"error":"invalid_grant"})");
        REQUIRE(err.details.empty());
    }

    SECTION("Encryption configuration error") {
        auto err = Error::EncryptionConfiguration("undetermined encryption");
        REQUIRE(err.category == ErrorCategory::EncryptionConfiguration);
        REQUIRE(err.message == "undetermined encryption");
        REQUIRE(err.details.empty());
    }

    SECTION("Signature verification error") {
        auto err = Error::SignatureVerification("Token signature verification failed", "token expired");
        REQUIRE(err.category == ErrorCategory::SignatureVerification);
        REQUIRE(err.details == "token expired");
    }

    SECTION("Configuration error") {
        auto err = Error::Config("Missing realm");
        REQUIRE(err.category == ErrorCategory::Configuration);
        REQUIRE(err.details.empty());
    }

    SECTION("Transport error") {
        auto err = Error::Transport("Provider returned HTTP 502", "https://idp/token", "Bad Gateway");
        REQUIRE(err.category == ErrorCategory::Transport);
        REQUIRE(err.details == "https://idp/token");
        REQUIRE(err.raw == "Bad Gateway");
    }

    SECTION("Invalid response error") {
        auto err = Error::InvalidResponse("Failed to parse JSON response", "{");
        REQUIRE(err.category == ErrorCategory::InvalidResponse);
        REQUIRE(err.raw == "{");
        REQUIRE(err.code.empty());
    }
}

TEST_CASE("Error::getCategoryName", "[error]") {
    REQUIRE(Error::IdentityProvider("c", "m", "").getCategoryName() == "IdentityProvider");
    REQUIRE(Error::EncryptionConfiguration("test").getCategoryName() == "EncryptionConfiguration");
    REQUIRE(Error::SignatureVerification("test").getCategoryName() == "SignatureVerification");
    REQUIRE(Error::Config("test").getCategoryName() == "Configuration");
    REQUIRE(Error::Transport("test").getCategoryName() == "Transport");
    REQUIRE(Error::InvalidResponse("test").getCategoryName() == "InvalidResponse");
}

TEST_CASE("Error::toJson", "[error]") {
    SECTION("Provider error carries code and payload") {
        auto err = Error::IdentityProvider("access_denied", "access_denied: nope", "payload-text");
        std::string json_str = err.toJson().dump();

        REQUIRE(json_str.find("false") != std::string::npos);  // success: false
        REQUIRE(json_str.find("IdentityProvider") != std::string::npos);
        REQUIRE(json_str.find("access_denied: nope") != std::string::npos);
        REQUIRE(json_str.find("\"code\"") != std::string::npos);
        REQUIRE(json_str.find("payload-text") != std::string::npos);
    }

    SECTION("Optional fields are omitted when empty") {
        auto err = Error::EncryptionConfiguration("undetermined encryption");
        std::string json_str = err.toJson().dump();

        REQUIRE(json_str.find("EncryptionConfiguration") != std::string::npos);
        REQUIRE(json_str.find("\"code\"") == std::string::npos);
        REQUIRE(json_str.find("\"details\"") == std::string::npos);
        REQUIRE(json_str.find("\"raw\"") == std::string::npos);
    }
}

TEST_CASE("Expected<T> - Success case", "[error]") {
    SECTION("Create with value") {
        Result<int> result(42);

        REQUIRE(result.has_value());
        REQUIRE(result.value() == 42);
        REQUIRE(*result == 42);
    }

    SECTION("Boolean conversion") {
        Result<int> success(42);
        REQUIRE(static_cast<bool>(success));

        Result<int> failure(Error::Config("test"));
        REQUIRE_FALSE(static_cast<bool>(failure));
    }

    SECTION("Take moves the value out") {
        Result<std::unique_ptr<int>> result(std::make_unique<int>(7));

        auto owned = result.take();

        REQUIRE(owned);
        REQUIRE(*owned == 7);
    }
}

TEST_CASE("Expected<T> - Error case", "[error]") {
    SECTION("Create with error") {
        Result<int> result(Error::Transport("Request failed"));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Transport);
        REQUIRE(result.error().message == "Request failed");
    }

    SECTION("Accessing value from error throws with the message") {
        Result<int> result(Error::EncryptionConfiguration("undetermined encryption"));

        REQUIRE_THROWS_WITH(result.value(),
                            Catch::Matchers::ContainsSubstring("undetermined encryption"));
    }

    SECTION("Accessing error from success throws") {
        Result<int> result(42);

        REQUIRE_THROWS_AS(result.error(), std::runtime_error);
    }
}

TEST_CASE("Expected<T> - Move semantics", "[error]") {
    SECTION("Move success value") {
        Result<std::string> r1("initial");
        Result<std::string> r2 = std::move(r1);

        REQUIRE(r2.has_value());
        REQUIRE(*r2 == "initial");
    }

    SECTION("Move error") {
        Result<int> r1(Error::SignatureVerification("test", "details"));
        Result<int> r2 = std::move(r1);

        REQUIRE_FALSE(r2.has_value());
        REQUIRE(r2.error().details == "details");
    }

    SECTION("Move assignment replaces the held state") {
        Result<std::string> r1(Error::Config("bad"));
        r1 = Result<std::string>("good");

        REQUIRE(r1.has_value());
        REQUIRE(*r1 == "good");
    }
}

TEST_CASE("Error propagation chain", "[error]") {
    auto parsePort = [](const std::string& s) -> Result<int> {
        try {
            return std::stoi(s);
        } catch (const std::exception&) {
            return Error::Config("Invalid port", "String: " + s);
        }
    };

    auto nextPort = [&](const std::string& s) -> Result<int> {
        auto r = parsePort(s);
        if (!r.has_value()) {
            return r.error();
        }
        return r.value() + 1;
    };

    auto r1 = nextPort("8080");
    REQUIRE(r1.has_value());
    REQUIRE(r1.value() == 8081);

    auto r2 = nextPort("invalid");
    REQUIRE_FALSE(r2.has_value());
    REQUIRE(r2.error().message == "Invalid port");
}
