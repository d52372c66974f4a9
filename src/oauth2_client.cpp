#include "include/oauth2_client.hpp"
#include "include/state_token_utils.hpp"
#include <crow/logging.h>
#include <crow/utility.h>
#include <algorithm>
#include <sstream>
#include <utility>

namespace kcconnect {

bool OAuth2Client::ParsedResponse::isJson() const {
    return static_cast<bool>(json);
}

bool OAuth2Client::ParsedResponse::isJsonObject() const {
    return isJson() && json.t() == crow::json::type::Object;
}

OAuth2Client::OAuth2Client(Options options,
                           std::shared_ptr<HttpTransport> transport,
                           ResponseChecker checker)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      checker_(std::move(checker)) {
    if (!transport_) {
        transport_ = std::make_shared<CurlHttpTransport>();
    }
}

QueryParams OAuth2Client::getAuthorizationParameters(QueryParams options) const {
    const std::string* state = UrlUtils::find(options, "state");
    if (!state || state->empty()) {
        options.erase(std::remove_if(options.begin(), options.end(),
                                     [](const auto& p) { return p.first == "state"; }),
                      options.end());
        options.emplace_back("state", StateTokenUtils::generateState());
    }

    const std::string* scope = UrlUtils::find(options, "scope");
    if (!scope || scope->empty()) {
        std::ostringstream joined;
        for (size_t i = 0; i < options_.scopes.size(); ++i) {
            if (i > 0) joined << options_.scope_separator;
            joined << options_.scopes[i];
        }
        options.erase(std::remove_if(options.begin(), options.end(),
                                     [](const auto& p) { return p.first == "scope"; }),
                      options.end());
        options.emplace_back("scope", joined.str());
    }

    UrlUtils::setDefault(options, "response_type", "code");
    UrlUtils::setDefault(options, "approval_prompt", "auto");

    if (!options_.redirect_uri.empty()) {
        UrlUtils::setDefault(options, "redirect_uri", options_.redirect_uri);
    }

    // client_id always reflects the configured client
    options.erase(std::remove_if(options.begin(), options.end(),
                                 [](const auto& p) { return p.first == "client_id"; }),
                  options.end());
    options.emplace_back("client_id", options_.client_id);

    return options;
}

AuthorizationRequest OAuth2Client::getAuthorizationUrl(const std::string& base_url,
                                                       QueryParams options) const {
    auto params = getAuthorizationParameters(std::move(options));

    AuthorizationRequest request;
    request.state = *UrlUtils::find(params, "state");
    request.url = UrlUtils::appendQuery(base_url, UrlUtils::buildQuery(params));

    CROW_LOG_DEBUG << "Built authorization URL on " << base_url;
    return request;
}

std::string OAuth2Client::basicAuthorizationHeader() const {
    std::string credentials = options_.client_id + ":" + options_.client_secret;
    return "Basic " + crow::utility::base64encode(credentials, credentials.size());
}

std::map<std::string, std::string> OAuth2Client::getAuthorizationHeaders(const AccessToken& token) const {
    return {{"Authorization", "Bearer " + token.getToken()}};
}

Result<AccessToken> OAuth2Client::getAccessToken(const std::string& token_url,
                                                 const std::string& grant_type,
                                                 const QueryParams& params) const {
    CROW_LOG_DEBUG << "Requesting access token with grant '" << grant_type << "' at: " << token_url;

    QueryParams form;
    form.emplace_back("grant_type", grant_type);
    for (const auto& param : params) {
        form.push_back(param);
    }

    std::map<std::string, std::string> headers{{"Accept", "application/json"}};

    if (options_.client_auth == ClientAuthMethod::BasicHeader) {
        headers["Authorization"] = basicAuthorizationHeader();
    } else {
        form.emplace_back("client_id", options_.client_id);
        form.emplace_back("client_secret", options_.client_secret);
    }

    if (!options_.redirect_uri.empty()) {
        form.emplace_back("redirect_uri", options_.redirect_uri);
    }

    auto response = transport_->postForm(token_url, UrlUtils::buildQuery(form), headers);

    auto parsed = parseResponse(response, token_url);
    if (!parsed) {
        return parsed.error();
    }

    auto token = AccessToken::fromJson(parsed->json, parsed->body);
    if (!token) {
        CROW_LOG_WARNING << "OAuth2 error: " << token.error().message;
        return token.error();
    }

    CROW_LOG_INFO << "Obtained access token via '" << grant_type << "' grant";
    return token;
}

Result<OAuth2Client::ParsedResponse> OAuth2Client::getAuthenticatedResponse(
    const std::string& url,
    const AccessToken& token) const {

    CROW_LOG_DEBUG << "Requesting protected resource: " << url;

    auto headers = getAuthorizationHeaders(token);
    headers["Accept"] = "application/json, application/jwt";

    auto response = transport_->get(url, headers);
    return parseResponse(response, url);
}

Result<OAuth2Client::ParsedResponse> OAuth2Client::parseResponse(
    const Result<HTTPClient::Response>& response,
    const std::string& url) const {

    if (!response) {
        const std::string& cause = response.error().details;
        CROW_LOG_WARNING << "OAuth2 error: request to " << url << " failed: " << cause;
        return Error::Transport("Request to " + url + " failed", cause);
    }

    ParsedResponse parsed;
    parsed.status_code = response->status_code;
    parsed.body = response->body;
    parsed.content_type = response->header("Content-Type");

    if (!parsed.body.empty()) {
        parsed.json = crow::json::load(parsed.body);
    }

    if (checker_) {
        if (auto error = checker_(parsed)) {
            CROW_LOG_WARNING << "OAuth2 error: provider rejected request to " << url
                             << ": " << error->message;
            return *error;
        }
    }

    if (parsed.status_code >= 400) {
        CROW_LOG_WARNING << "OAuth2 error: " << url << " returned status " << parsed.status_code;
        return Error::Transport("Provider returned HTTP " + std::to_string(parsed.status_code),
                                url, parsed.body);
    }

    if (parsed.content_type.find("json") != std::string::npos && !parsed.isJson()) {
        return Error::InvalidResponse("Failed to parse JSON response", parsed.body);
    }

    return parsed;
}

} // namespace kcconnect
