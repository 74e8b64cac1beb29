/**
 * @file ota_error.hpp
 * @brief Failure kinds reported by the container codec and the CLI
 *
 * Every pack/unpack failure aborts the call and carries one of these kinds
 * together with a human-readable message naming the offending values.
 */

#ifndef OTA_ERROR_HPP
#define OTA_ERROR_HPP

#include <cstdint>
#include <string>

/**
 * @brief Codec failure kinds
 */
enum class OtaError : uint8_t {
    NONE = 0,                   /* Success */
    TOO_SMALL = 1,              /* Input shorter than the 32-byte header */
    BAD_MAGIC = 2,              /* Magic bytes differ from 14 17 0B 17 */
    INTEGRITY_MISMATCH = 3,     /* Stored and recomputed MD5 differ */
    CIPHER_LENGTH = 4,          /* Payload is not a multiple of the block size */
    CIPHER_PROVIDER_FAILURE = 5,/* Cipher primitive reported an error */
    NOT_AN_ARCHIVE = 6,         /* Encode input is neither .swu nor a zip */
    PAYLOAD_TOO_LARGE = 7,      /* Payload does not fit the u32 length field */
    ARCHIVE_FORMAT = 8,         /* Zip structure could not be read or written */
    IO_ERROR = 9,               /* File read/write failure */
    CONFIG_ERROR = 10           /* Unreadable config or malformed key material */
};

/**
 * @brief Stable name of an error kind (used in diagnostics)
 */
inline std::string getErrorString(OtaError error) {
    switch (error) {
        case OtaError::NONE:
            return "NONE";
        case OtaError::TOO_SMALL:
            return "TOO_SMALL";
        case OtaError::BAD_MAGIC:
            return "BAD_MAGIC";
        case OtaError::INTEGRITY_MISMATCH:
            return "INTEGRITY_MISMATCH";
        case OtaError::CIPHER_LENGTH:
            return "CIPHER_LENGTH";
        case OtaError::CIPHER_PROVIDER_FAILURE:
            return "CIPHER_PROVIDER_FAILURE";
        case OtaError::NOT_AN_ARCHIVE:
            return "NOT_AN_ARCHIVE";
        case OtaError::PAYLOAD_TOO_LARGE:
            return "PAYLOAD_TOO_LARGE";
        case OtaError::ARCHIVE_FORMAT:
            return "ARCHIVE_FORMAT";
        case OtaError::IO_ERROR:
            return "IO_ERROR";
        case OtaError::CONFIG_ERROR:
            return "CONFIG_ERROR";
        default:
            return "UNKNOWN";
    }
}

#endif // OTA_ERROR_HPP
