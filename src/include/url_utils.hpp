#pragma once

#include <string>
#include <utility>
#include <vector>

namespace kcconnect {

// Ordered query parameters; insertion order is preserved in the encoded query
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * URL helpers shared by the endpoint resolver and the OAuth2 client
 */
class UrlUtils {
public:
    /**
     * Percent-encode a value per RFC 3986.
     * Unreserved characters (ALPHA, DIGIT, '-', '.', '_', '~') pass through.
     */
    static std::string encode(const std::string& value);

    /**
     * Build "k1=v1&k2=v2" with both keys and values encoded
     */
    static std::string buildQuery(const QueryParams& params);

    /**
     * Append a query string to a URL, using '&' if the URL already has one.
     * Leading/trailing '?' and '&' in the query are ignored; an empty query
     * returns the URL unchanged.
     */
    static std::string appendQuery(const std::string& url, const std::string& query);

    /**
     * Find a parameter value by key
     * @return Pointer into params or nullptr if the key is absent
     */
    static const std::string* find(const QueryParams& params, const std::string& key);

    /**
     * Set a parameter only if the key is not present yet
     */
    static void setDefault(QueryParams& params, const std::string& key, const std::string& value);
};

} // namespace kcconnect
