/**
 * @file cli_args.cpp
 * @brief Command-line value parsing
 */

#include "cli_args.hpp"

bool parseVersionNumber(const std::string& text, unsigned int& value) {
    if (text.empty()) {
        return false;
    }

    // Always base 10, so "010" is ten. Overlong values wrap; only the low
    // 8 bits reach the header.
    unsigned int parsed = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        parsed = parsed * 10u + static_cast<unsigned int>(c - '0');
    }

    value = parsed;
    return true;
}
