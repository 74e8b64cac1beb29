/**
 * @file hex_util.cpp
 * @brief Hex conversion helpers
 */

#include "hex_util.hpp"
#include <iomanip>
#include <sstream>

std::string bytesToHex(const uint8_t* data, size_t size) {
    std::ostringstream out;
    for (size_t i = 0; i < size; i++) {
        out << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return out.str();
}

static int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hexToBytes(const std::string& hex_string, std::vector<uint8_t>& binary) {
    if (hex_string.length() % 2 != 0) {
        return false;
    }

    std::vector<uint8_t> result;
    result.reserve(hex_string.length() / 2);

    for (size_t i = 0; i < hex_string.length(); i += 2) {
        int hi = hexDigitValue(hex_string[i]);
        int lo = hexDigitValue(hex_string[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    binary.swap(result);
    return true;
}
