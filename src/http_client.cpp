#include "include/http_client.hpp"
#include <crow/logging.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>

namespace kcconnect {

namespace {

std::once_flag curl_init_flag;

void ensureCurlInitialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

/**
 * Callback for libcurl to write response data
 */
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

/**
 * Callback for libcurl to write response headers
 */
static size_t header_callback(char* buffer, size_t size, size_t nmemb, std::map<std::string, std::string>* userp) {
    std::string header_line(buffer, size * nmemb);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string header_name = header_line.substr(0, colon_pos);
        std::string header_value = header_line.substr(colon_pos + 1);

        header_value.erase(0, header_value.find_first_not_of(" \t"));
        header_value.erase(header_value.find_last_not_of(" \r\n") + 1);

        (*userp)[header_name] = header_value;
    }

    return size * nmemb;
}

std::string HTTPClient::Response::header(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& entry : headers) {
        if (toLower(entry.first) == wanted) {
            return entry.second;
        }
    }
    return "";
}

Result<HTTPClient::Response> HTTPClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    const Options& options) {

    return performRequest(Method::GET, url, "", headers, options);
}

Result<HTTPClient::Response> HTTPClient::post_form(
    const std::string& url,
    const std::string& form_data,
    const std::map<std::string, std::string>& headers,
    const Options& options) {

    auto request_headers = headers;
    if (request_headers.find("Content-Type") == request_headers.end()) {
        request_headers["Content-Type"] = "application/x-www-form-urlencoded";
    }

    return performRequest(Method::POST, url, form_data, request_headers, options);
}

Result<HTTPClient::Response> HTTPClient::performRequest(
    Method method,
    const std::string& url,
    const std::string& data,
    const std::map<std::string, std::string>& headers,
    const Options& options) {

    ensureCurlInitialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        CROW_LOG_ERROR << "Failed to initialize CURL";
        return Error::Transport("HTTP request failed", "Failed to initialize CURL");
    }

    Response response;
    response.status_code = 0;
    struct curl_slist* header_list = nullptr;

    try {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

        if (method == Method::POST) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()));
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_seconds));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.request_timeout_seconds));

        if (!options.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
            CROW_LOG_WARNING << "SSL verification disabled - use only for development";
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        }

        for (const auto& header : headers) {
            std::string header_str = header.first + ": " + header.second;
            header_list = curl_slist_append(header_list, header_str.c_str());
        }
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_USERAGENT, "kcconnect/1.0");

        CURLcode res = curl_easy_perform(curl);

        if (header_list) {
            curl_slist_free_all(header_list);
            header_list = nullptr;
        }

        if (res != CURLE_OK) {
            std::string cause = curl_easy_strerror(res);
            CROW_LOG_ERROR << "HTTP request failed: " << cause << " (URL: " << url << ")";
            curl_easy_cleanup(curl);
            return Error::Transport("HTTP request failed", cause);
        }

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = (int)http_code;

        CROW_LOG_DEBUG << "HTTP " << (method == Method::GET ? "GET" : "POST")
                       << " " << url << " -> " << response.status_code;

        curl_easy_cleanup(curl);
        return std::move(response);

    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "HTTP request exception: " << e.what();
        if (header_list) {
            curl_slist_free_all(header_list);
        }
        curl_easy_cleanup(curl);
        return Error::Transport("HTTP request failed", e.what());
    }
}

Result<HTTPClient::Response> CurlHttpTransport::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers) {

    return HTTPClient::get(url, headers, options_);
}

Result<HTTPClient::Response> CurlHttpTransport::postForm(
    const std::string& url,
    const std::string& form_data,
    const std::map<std::string, std::string>& headers) {

    return HTTPClient::post_form(url, form_data, headers, options_);
}

} // namespace kcconnect
