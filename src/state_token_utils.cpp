#include "include/state_token_utils.hpp"

#include <random>
#include <algorithm>
#include <cctype>

namespace kcconnect {

std::string StateTokenUtils::generateState(std::size_t length) {
    static const char alphanum[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";

    static const std::size_t alphanum_size = sizeof(alphanum) - 1;

    std::random_device rd;
    std::uniform_int_distribution<std::size_t> dis(0, alphanum_size - 1);

    std::string state;
    state.reserve(length);

    for (std::size_t i = 0; i < length; ++i) {
        state += alphanum[dis(rd)];
    }

    return state;
}

bool StateTokenUtils::isValidStateFormat(const std::string& state) {
    if (state.empty()) {
        return false;
    }

    return std::all_of(state.begin(), state.end(), [](unsigned char c) {
        return std::isalnum(c);
    });
}

bool StateTokenUtils::statesMatch(const std::string& expected, const std::string& received) {
    if (expected.empty() || expected.size() != received.size()) {
        return false;
    }

    unsigned char diff = 0;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        diff |= static_cast<unsigned char>(expected[i] ^ received[i]);
    }
    return diff == 0;
}

} // namespace kcconnect
