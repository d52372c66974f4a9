#pragma once

#include <string>
#include <map>
#include <memory>
#include "error.hpp"

namespace kcconnect {

/**
 * HTTP Client for making outbound requests to the identity provider
 * Supports GET and form POST requests
 */
class HTTPClient {
public:
    /**
     * HTTP request methods
     */
    enum class Method {
        GET,
        POST
    };

    /**
     * HTTP response data
     */
    struct Response {
        int status_code = 0;                       // HTTP status (200, 404, 500, etc.)
        std::string body;                          // Response body
        std::map<std::string, std::string> headers; // Response headers

        /**
         * Case-insensitive header lookup, empty if absent
         */
        std::string header(const std::string& name) const;
    };

    /**
     * Per-client connection settings
     */
    struct Options {
        int connect_timeout_seconds = 10;
        int request_timeout_seconds = 30;
        bool verify_ssl = true;  // Only disable for testing/development
    };

    /**
     * Make GET request
     */
    static Result<Response> get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {},
        const Options& options = Options{}
    );

    /**
     * Make POST request with form data
     * @param form_data Form data as encoded query string (key1=value1&key2=value2)
     */
    static Result<Response> post_form(
        const std::string& url,
        const std::string& form_data,
        const std::map<std::string, std::string>& headers = {},
        const Options& options = Options{}
    );

private:
    /**
     * Perform actual HTTP request using libcurl
     * @return Response, or a Transport error carrying the curl error text
     */
    static Result<Response> performRequest(
        Method method,
        const std::string& url,
        const std::string& data,
        const std::map<std::string, std::string>& headers,
        const Options& options
    );
};

/**
 * Transport seam used by the OAuth2 client; tests substitute a fake
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HTTPClient::Response> get(
        const std::string& url,
        const std::map<std::string, std::string>& headers) = 0;

    virtual Result<HTTPClient::Response> postForm(
        const std::string& url,
        const std::string& form_data,
        const std::map<std::string, std::string>& headers) = 0;
};

/**
 * libcurl-backed transport
 */
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(HTTPClient::Options options = HTTPClient::Options{})
        : options_(options) {}

    Result<HTTPClient::Response> get(
        const std::string& url,
        const std::map<std::string, std::string>& headers) override;

    Result<HTTPClient::Response> postForm(
        const std::string& url,
        const std::string& form_data,
        const std::map<std::string, std::string>& headers) override;

    const HTTPClient::Options& options() const { return options_; }

private:
    HTTPClient::Options options_;
};

} // namespace kcconnect
