#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "oauth2_client.hpp"
#include "test_utils.hpp"

#include <algorithm>

using namespace kcconnect;
using namespace kcconnect::test;

namespace {

OAuth2Client::Options clientOptions() {
    OAuth2Client::Options options;
    options.client_id = "portal";
    options.client_secret = "s3cr3t";
    options.redirect_uri = "https://app.example.com/callback";
    options.scopes = {"openid", "profile"};
    options.scope_separator = " ";
    return options;
}

} // namespace

TEST_CASE("OAuth2Client::getAuthorizationParameters", "[oauth2][authorize]") {
    OAuth2Client client(clientOptions(), std::make_shared<MockHttpTransport>());

    SECTION("Fills in defaults") {
        auto params = client.getAuthorizationParameters({});

        REQUIRE(UrlUtils::find(params, "state") != nullptr);
        REQUIRE(*UrlUtils::find(params, "scope") == "openid profile");
        REQUIRE(*UrlUtils::find(params, "response_type") == "code");
        REQUIRE(*UrlUtils::find(params, "approval_prompt") == "auto");
        REQUIRE(*UrlUtils::find(params, "redirect_uri") == "https://app.example.com/callback");
        REQUIRE(*UrlUtils::find(params, "client_id") == "portal");
    }

    SECTION("Keeps caller values") {
        auto params = client.getAuthorizationParameters(
            {{"state", "abc"}, {"scope", "email"}, {"response_type", "token"}, {"kc_idp_hint", "github"}});

        REQUIRE(*UrlUtils::find(params, "state") == "abc");
        REQUIRE(*UrlUtils::find(params, "scope") == "email");
        REQUIRE(*UrlUtils::find(params, "response_type") == "token");
        REQUIRE(*UrlUtils::find(params, "kc_idp_hint") == "github");
    }

    SECTION("Empty state is replaced") {
        auto params = client.getAuthorizationParameters({{"state", ""}});

        REQUIRE_FALSE(UrlUtils::find(params, "state")->empty());
        REQUIRE(std::count_if(params.begin(), params.end(),
                              [](const auto& p) { return p.first == "state"; }) == 1);
    }

    SECTION("Configured client id always wins") {
        auto params = client.getAuthorizationParameters({{"client_id", "intruder"}});

        REQUIRE(*UrlUtils::find(params, "client_id") == "portal");
    }
}

TEST_CASE("OAuth2Client::getAuthorizationUrl", "[oauth2][authorize]") {
    OAuth2Client client(clientOptions(), std::make_shared<MockHttpTransport>());

    SECTION("Encodes parameters onto the base URL") {
        auto request = client.getAuthorizationUrl("https://idp/auth", {{"state", "s1"}});

        REQUIRE(request.state == "s1");
        REQUIRE(request.url == "https://idp/auth?state=s1&scope=openid%20profile&response_type=code"
                               "&approval_prompt=auto&redirect_uri=https%3A%2F%2Fapp.example.com%2Fcallback"
                               "&client_id=portal");
    }

    SECTION("Base URL with an existing query") {
        auto request = client.getAuthorizationUrl("https://idp/auth?kc_locale=de", {{"state", "s1"}});

        REQUIRE_THAT(request.url, Catch::Matchers::StartsWith("https://idp/auth?kc_locale=de&state=s1"));
    }
}

TEST_CASE("OAuth2Client::getAccessToken", "[oauth2][grant]") {
    auto transport = std::make_shared<MockHttpTransport>();

    SECTION("Form fields are sent in order") {
        OAuth2Client client(clientOptions(), transport);
        transport->queueResponse(200, R"({"access_token":"t"})");

        auto token = client.getAccessToken("https://idp/token", "authorization_code", {{"code", "c 1"}});

        REQUIRE(token.has_value());
        REQUIRE(transport->calls.at(0).body ==
                "grant_type=authorization_code&code=c%201&client_id=portal&client_secret=s3cr3t"
                "&redirect_uri=https%3A%2F%2Fapp.example.com%2Fcallback");
    }

    SECTION("Without a checker provider errors fall through to the status check") {
        OAuth2Client client(clientOptions(), transport);
        transport->queueResponse(400, R"({"error":"invalid_grant"})");

        auto token = client.getAccessToken("https://idp/token", "authorization_code", {{"code", "c"}});

        REQUIRE_FALSE(token.has_value());
        REQUIRE(token.error().category == ErrorCategory::Transport);
        REQUIRE(token.error().raw == R"({"error":"invalid_grant"})");
    }

    SECTION("Checker runs before the status check") {
        int checked = 0;
        OAuth2Client client(clientOptions(), transport,
                            [&checked](const OAuth2Client::ParsedResponse& response) -> std::optional<Error> {
                                ++checked;
                                if (response.status_code == 418) {
                                    return Error::IdentityProvider("teapot", "teapot: short and stout", response.body);
                                }
                                return std::nullopt;
                            });
        transport->queueResponse(418, "{}");

        auto token = client.getAccessToken("https://idp/token", "refresh_token", {{"refresh_token", "r"}});

        REQUIRE(checked == 1);
        REQUIRE_FALSE(token.has_value());
        REQUIRE(token.error().code == "teapot");
    }

    SECTION("Redirect URI is omitted when not configured") {
        auto options = clientOptions();
        options.redirect_uri.clear();
        OAuth2Client client(options, transport);
        transport->queueResponse(200, R"({"access_token":"t"})");

        REQUIRE(client.getAccessToken("https://idp/token", "refresh_token", {{"refresh_token", "r"}}).has_value());

        auto form = MockHttpTransport::parseForm(transport->calls.at(0).body);
        REQUIRE(form.count("redirect_uri") == 0);
    }
}

TEST_CASE("OAuth2Client::getAuthenticatedResponse", "[oauth2]") {
    auto transport = std::make_shared<MockHttpTransport>();
    OAuth2Client client(clientOptions(), transport);
    AccessToken token;
    token.access_token = "bearer-value";

    SECTION("Sends bearer and accept headers") {
        transport->queueResponse(200, R"({"sub":"1"})");

        auto response = client.getAuthenticatedResponse("https://idp/userinfo", token);

        REQUIRE(response.has_value());
        REQUIRE(response->isJsonObject());
        REQUIRE(response->status_code == 200);
        const auto& headers = transport->calls.at(0).headers;
        REQUIRE(headers.at("Authorization") == "Bearer bearer-value");
        REQUIRE(headers.at("Accept") == "application/json, application/jwt");
    }

    SECTION("Non-JSON bodies are returned as-is") {
        transport->queueResponse(200, "a.b.c", "application/jwt");

        auto response = client.getAuthenticatedResponse("https://idp/userinfo", token);

        REQUIRE(response.has_value());
        REQUIRE_FALSE(response->isJson());
        REQUIRE(response->body == "a.b.c");
        REQUIRE(response->content_type == "application/jwt");
    }

    SECTION("Connection failure carries the transport cause") {
        transport->queueFailure("Timeout was reached");

        auto response = client.getAuthenticatedResponse("https://idp/userinfo", token);

        REQUIRE_FALSE(response.has_value());
        REQUIRE(response.error().category == ErrorCategory::Transport);
        REQUIRE(response.error().details == "Timeout was reached");
    }
}

TEST_CASE("OAuth2Client::basicAuthorizationHeader", "[oauth2]") {
    OAuth2Client client(clientOptions(), std::make_shared<MockHttpTransport>());

    REQUIRE(client.basicAuthorizationHeader() == "Basic cG9ydGFsOnMzY3IzdA==");
}
