#pragma once

#include <string>

namespace kcconnect {

/**
 * Random values for the OAuth2 "state" parameter
 */
class StateTokenUtils {
public:
    /**
     * Generate a random alphanumeric state value
     * @param length Token length (default: 32)
     */
    static std::string generateState(std::size_t length = 32);

    /**
     * True if the value is a non-empty alphanumeric string
     */
    static bool isValidStateFormat(const std::string& state);

    /**
     * Constant-time comparison of the stored and the returned state
     */
    static bool statesMatch(const std::string& expected, const std::string& received);
};

} // namespace kcconnect
