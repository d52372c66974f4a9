#include "include/url_utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace kcconnect {

std::string UrlUtils::encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (const auto c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
            continue;
        }

        escaped << '%' << std::setw(2) << static_cast<int>(uc);
    }

    return escaped.str();
}

std::string UrlUtils::buildQuery(const QueryParams& params) {
    std::ostringstream query;
    bool first = true;
    for (const auto& param : params) {
        if (!first) {
            query << '&';
        }
        first = false;
        query << encode(param.first) << '=' << encode(param.second);
    }
    return query.str();
}

std::string UrlUtils::appendQuery(const std::string& url, const std::string& query) {
    size_t begin = query.find_first_not_of("?&");
    if (begin == std::string::npos) {
        return url;
    }
    size_t end = query.find_last_not_of("?&");
    std::string trimmed = query.substr(begin, end - begin + 1);

    char glue = url.find('?') == std::string::npos ? '?' : '&';
    return url + glue + trimmed;
}

const std::string* UrlUtils::find(const QueryParams& params, const std::string& key) {
    for (const auto& param : params) {
        if (param.first == key) {
            return &param.second;
        }
    }
    return nullptr;
}

void UrlUtils::setDefault(QueryParams& params, const std::string& key, const std::string& value) {
    if (!find(params, key)) {
        params.emplace_back(key, value);
    }
}

} // namespace kcconnect
