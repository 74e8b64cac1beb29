/**
 * @file integrity_checker.hpp
 * @brief Payload digest (MD5) computation and verification
 *
 * MD5 is mandated by the device firmware. It detects accidental corruption
 * of the encrypted payload, not tampering.
 */

#ifndef INTEGRITY_CHECKER_HPP
#define INTEGRITY_CHECKER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "ota_header.hpp"

/**
 * @brief Outcome of a digest comparison
 */
enum class DigestCheck : uint8_t {
    MATCH = 0,          /* Recomputed digest equals the expected one */
    MISMATCH = 1,       /* Digest computed, values differ */
    FAILED = 2          /* Digest primitive reported an error */
};

class IntegrityChecker {
public:
    /**
     * @brief Calculate MD5 of a buffer
     * @param data Input bytes
     * @param size Input size
     * @param digest Output digest (16 bytes)
     * @return true if successful
     */
    static bool digest(const uint8_t* data, size_t size, uint8_t digest[OTA_DIGEST_SIZE]);

    static bool digest(const std::vector<uint8_t>& data, uint8_t out[OTA_DIGEST_SIZE]) {
        return digest(data.data(), data.size(), out);
    }

    /**
     * @brief Recompute the digest and compare against the expected one
     * @param calculated Receives the recomputed digest (for diagnostics)
     */
    static DigestCheck verify(const uint8_t* data, size_t size,
                       const uint8_t expected[OTA_DIGEST_SIZE],
                       uint8_t calculated[OTA_DIGEST_SIZE]);
};

#endif // INTEGRITY_CHECKER_HPP
