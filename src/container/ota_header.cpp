/**
 * @file ota_header.cpp
 * @brief OTA Container Header Codec Implementation
 */

#include "ota_header.hpp"
#include "hex_util.hpp"
#include <iostream>
#include <cstring>

const uint8_t OTA_MAGIC[OTA_MAGIC_SIZE] = {0x14, 0x17, 0x0B, 0x17};
const uint8_t OTA_CUSTOM_INFO[OTA_CUSTOM_INFO_SIZE] = {0x01, 0x00, 0x00, 0x00};

// ==================== Little-endian helpers ====================

static uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static void writeU32LE(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

// ==================== Comparison ====================

bool operator==(const OtaHeader& lhs, const OtaHeader& rhs) {
    return std::memcmp(lhs.magic, rhs.magic, OTA_MAGIC_SIZE) == 0 &&
           lhs.version_major == rhs.version_major &&
           lhs.version_minor == rhs.version_minor &&
           lhs.version_patch == rhs.version_patch &&
           lhs.board_type == rhs.board_type &&
           std::memcmp(lhs.custom_info, rhs.custom_info, OTA_CUSTOM_INFO_SIZE) == 0 &&
           lhs.payload_length == rhs.payload_length &&
           std::memcmp(lhs.payload_digest, rhs.payload_digest, OTA_DIGEST_SIZE) == 0;
}

bool operator!=(const OtaHeader& lhs, const OtaHeader& rhs) {
    return !(lhs == rhs);
}

// ==================== Parse / Serialize ====================

bool OtaHeaderCodec::parse(const uint8_t* data, size_t size, OtaHeader& header) {
    if (data == nullptr || size < OTA_HEADER_SIZE) {
        return false;
    }

    std::memcpy(header.magic, data + 0x00, OTA_MAGIC_SIZE);
    header.version_major = data[0x04];
    header.version_minor = data[0x05];
    header.version_patch = data[0x06];
    header.board_type    = data[0x07];
    std::memcpy(header.custom_info, data + 0x08, OTA_CUSTOM_INFO_SIZE);
    header.payload_length = readU32LE(data + 0x0C);
    std::memcpy(header.payload_digest, data + 0x10, OTA_DIGEST_SIZE);

    return true;
}

std::vector<uint8_t> OtaHeaderCodec::serialize(const OtaHeader& header) {
    std::vector<uint8_t> out(OTA_HEADER_SIZE, 0);

    std::memcpy(out.data() + 0x00, header.magic, OTA_MAGIC_SIZE);
    out[0x04] = header.version_major;
    out[0x05] = header.version_minor;
    out[0x06] = header.version_patch;
    out[0x07] = header.board_type;
    std::memcpy(out.data() + 0x08, header.custom_info, OTA_CUSTOM_INFO_SIZE);
    writeU32LE(out.data() + 0x0C, header.payload_length);
    std::memcpy(out.data() + 0x10, header.payload_digest, OTA_DIGEST_SIZE);

    return out;
}

bool OtaHeaderCodec::hasValidMagic(const OtaHeader& header) {
    return std::memcmp(header.magic, OTA_MAGIC, OTA_MAGIC_SIZE) == 0;
}

OtaHeader OtaHeaderCodec::makeHeader(const FirmwareVersion& version,
                                     uint32_t payload_length,
                                     const uint8_t digest[OTA_DIGEST_SIZE]) {
    OtaHeader header;
    std::memset(&header, 0, sizeof(OtaHeader));

    std::memcpy(header.magic, OTA_MAGIC, OTA_MAGIC_SIZE);
    header.version_major = static_cast<uint8_t>(version.major & 0xFF);
    header.version_minor = static_cast<uint8_t>(version.minor & 0xFF);
    header.version_patch = static_cast<uint8_t>(version.patch & 0xFF);
    header.board_type    = static_cast<uint8_t>(version.board_type & 0xFF);
    std::memcpy(header.custom_info, OTA_CUSTOM_INFO, OTA_CUSTOM_INFO_SIZE);
    header.payload_length = payload_length;
    std::memcpy(header.payload_digest, digest, OTA_DIGEST_SIZE);

    return header;
}

void OtaHeaderCodec::printSummary(const OtaHeader& header, size_t actual_payload_size) {
    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "  OTA Container Header\n";
    std::cout << "========================================\n";
    std::cout << "Magic:         " << bytesToHex(header.magic, OTA_MAGIC_SIZE)
              << (hasValidMagic(header) ? " (valid)" : " (INVALID)") << "\n";
    std::cout << "Version:       " << (int)header.version_major << "."
              << (int)header.version_minor << "."
              << (int)header.version_patch << "\n";
    std::cout << "Board Type:    " << (int)header.board_type << "\n";
    std::cout << "Custom Info:   " << bytesToHex(header.custom_info, OTA_CUSTOM_INFO_SIZE) << "\n";
    std::cout << "Enc Length:    " << header.payload_length << " bytes (file has "
              << actual_payload_size << " bytes)\n";
    std::cout << "Stored MD5:    " << bytesToHex(header.payload_digest, OTA_DIGEST_SIZE) << "\n";
    std::cout << "========================================\n\n";
}
