/**
 * @file ota_header.hpp
 * @brief OTA Container Header (32 bytes, little-endian)
 *
 * Container layout:
 *   [0x00 - 0x03]  4 bytes  - OTA magic (14 17 0B 17)
 *   [0x04 - 0x07]  4 bytes  - firmware info (major, minor, patch, board_type)
 *   [0x08 - 0x0B]  4 bytes  - custom info (01 00 00 00 on encode)
 *   [0x0C - 0x0F]  4 bytes  - encrypted payload length (LE uint32)
 *   [0x10 - 0x1F] 16 bytes  - MD5 of encrypted payload
 *   [0x20 - EOF ]  N bytes  - AES-256-CBC encrypted zip archive
 *
 * @version 1.0
 */

#ifndef OTA_HEADER_HPP
#define OTA_HEADER_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

// ==================== Constants ====================

#define OTA_HEADER_SIZE         32
#define OTA_MAGIC_SIZE          4
#define OTA_CUSTOM_INFO_SIZE    4
#define OTA_DIGEST_SIZE         16

extern const uint8_t OTA_MAGIC[OTA_MAGIC_SIZE];             // 14 17 0B 17
extern const uint8_t OTA_CUSTOM_INFO[OTA_CUSTOM_INFO_SIZE]; // 01 00 00 00

// ==================== Header ====================

/**
 * @brief Firmware version and target board, as given by the caller
 *
 * Values wider than a byte are masked to their low 8 bits when the
 * header is built (300 is stored as 44).
 */
struct FirmwareVersion {
    unsigned int major = 0;
    unsigned int minor = 0;
    unsigned int patch = 0;
    unsigned int board_type = 0;        // 0 = e100_lite / e100
};

/**
 * @brief OTA Container Header
 *
 * Size: 32 bytes
 * Location: Offset 0x0000 in the .bin container
 */
struct OtaHeader {
    uint8_t  magic[OTA_MAGIC_SIZE];             // 14 17 0B 17
    uint8_t  version_major;
    uint8_t  version_minor;
    uint8_t  version_patch;
    uint8_t  board_type;
    uint8_t  custom_info[OTA_CUSTOM_INFO_SIZE]; // opaque, passed through on decode
    uint32_t payload_length;                    // encrypted payload size
    uint8_t  payload_digest[OTA_DIGEST_SIZE];   // MD5 over encrypted payload
} __attribute__((packed));  // 32 bytes

static_assert(sizeof(OtaHeader) == OTA_HEADER_SIZE, "OtaHeader layout/size mismatch");

bool operator==(const OtaHeader& lhs, const OtaHeader& rhs);
bool operator!=(const OtaHeader& lhs, const OtaHeader& rhs);

// ==================== Header Codec ====================

/**
 * @brief Header Codec Class
 *
 * Byte-exact parse/serialize of the 32-byte header. Magic validation is
 * kept separate so callers can print a malformed header before aborting.
 */
class OtaHeaderCodec {
public:
    /**
     * @brief Parse the first 32 bytes of a buffer
     * @param data Buffer start
     * @param size Buffer size (must be >= 32)
     * @param header Output header
     * @return false if the buffer is too small
     */
    static bool parse(const uint8_t* data, size_t size, OtaHeader& header);

    static bool parse(const std::vector<uint8_t>& bytes, OtaHeader& header) {
        return parse(bytes.data(), bytes.size(), header);
    }

    /**
     * @brief Serialize a header to exactly 32 bytes
     */
    static std::vector<uint8_t> serialize(const OtaHeader& header);

    /**
     * @brief Check magic bytes against 14 17 0B 17
     */
    static bool hasValidMagic(const OtaHeader& header);

    /**
     * @brief Build a header for a freshly encrypted payload
     * @param version Firmware version (each field masked to 8 bits)
     * @param payload_length Encrypted payload size
     * @param digest MD5 of the encrypted payload
     */
    static OtaHeader makeHeader(const FirmwareVersion& version,
                                uint32_t payload_length,
                                const uint8_t digest[OTA_DIGEST_SIZE]);

    /**
     * @brief Print header fields (diagnostics)
     */
    static void printSummary(const OtaHeader& header, size_t actual_payload_size);
};

#endif // OTA_HEADER_HPP
