/**
 * @file hex_util.hpp
 * @brief Hex conversion helpers (digests in diagnostics, key material in config)
 */

#ifndef HEX_UTIL_HPP
#define HEX_UTIL_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

/**
 * @brief Lowercase hex string of a byte buffer
 */
std::string bytesToHex(const uint8_t* data, size_t size);

inline std::string bytesToHex(const std::vector<uint8_t>& data) {
    return bytesToHex(data.data(), data.size());
}

/**
 * @brief Convert hex string to binary
 * @param hex_string Hex string (case-insensitive, even length)
 * @param binary Output bytes
 * @return false on odd length or a non-hex character
 */
bool hexToBytes(const std::string& hex_string, std::vector<uint8_t>& binary);

#endif // HEX_UTIL_HPP
