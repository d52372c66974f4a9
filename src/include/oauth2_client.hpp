#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <crow/json.h>
#include "access_token.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "url_utils.hpp"

namespace kcconnect {

/**
 * How the client proves its identity at the token endpoint
 */
enum class ClientAuthMethod {
    RequestBody,  // client_id/client_secret form fields (client_secret_post)
    BasicHeader   // Authorization: Basic base64(id:secret) (client_secret_basic)
};

/**
 * Authorization redirect plus the state the caller must keep for the callback
 */
struct AuthorizationRequest {
    std::string url;
    std::string state;
};

/**
 * Provider-agnostic OAuth2 client: authorization URL templating, grant
 * exchange at a token endpoint and bearer-authenticated requests.
 * Provider adapters plug in their error detection through a ResponseChecker.
 */
class OAuth2Client {
public:
    struct Options {
        std::string client_id;
        std::string client_secret;
        std::string redirect_uri;
        std::vector<std::string> scopes;
        std::string scope_separator = ",";
        ClientAuthMethod client_auth = ClientAuthMethod::RequestBody;
    };

    /**
     * Provider response with the body parsed as JSON when possible
     */
    struct ParsedResponse {
        int status_code = 0;
        std::string body;
        std::string content_type;
        crow::json::rvalue json;

        bool isJson() const;
        bool isJsonObject() const;
    };

    /**
     * Returns an error when the provider reported one in the response
     */
    using ResponseChecker = std::function<std::optional<Error>(const ParsedResponse&)>;

    OAuth2Client(Options options,
                 std::shared_ptr<HttpTransport> transport,
                 ResponseChecker checker = nullptr);

    /**
     * Complete caller options with state, scope, response_type,
     * approval_prompt, redirect_uri and client_id where they are missing
     */
    QueryParams getAuthorizationParameters(QueryParams options) const;

    /**
     * Authorization URL on the given endpoint; a random state is generated
     * unless the caller passes one
     */
    AuthorizationRequest getAuthorizationUrl(const std::string& base_url,
                                             QueryParams options = {}) const;

    /**
     * Exchange a grant at the token endpoint
     * @param grant_type e.g. "authorization_code" or "refresh_token"
     * @param params Grant-specific parameters (code, refresh_token, ...)
     */
    Result<AccessToken> getAccessToken(const std::string& token_url,
                                       const std::string& grant_type,
                                       const QueryParams& params) const;

    /**
     * GET a protected resource with "Authorization: Bearer <token>"
     */
    Result<ParsedResponse> getAuthenticatedResponse(const std::string& url,
                                                    const AccessToken& token) const;

    std::map<std::string, std::string> getAuthorizationHeaders(const AccessToken& token) const;

    /**
     * "Basic " + base64(client_id:client_secret)
     */
    std::string basicAuthorizationHeader() const;

    const Options& options() const { return options_; }

private:
    Result<ParsedResponse> parseResponse(const Result<HTTPClient::Response>& response,
                                         const std::string& url) const;

    Options options_;
    std::shared_ptr<HttpTransport> transport_;
    ResponseChecker checker_;
};

} // namespace kcconnect
