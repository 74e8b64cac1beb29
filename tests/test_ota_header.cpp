#include "ota_header.hpp"
#include <iostream>
#include <cstring>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

int main() {
    bool ok = true;

    uint8_t digest[OTA_DIGEST_SIZE];
    for (int i = 0; i < OTA_DIGEST_SIZE; ++i) digest[i] = static_cast<uint8_t>(0xA0 + i);

    FirmwareVersion version;
    version.major = 1;
    version.minor = 1;
    version.patch = 46;
    version.board_type = 0;

    OtaHeader h = OtaHeaderCodec::makeHeader(version, 0x12345678, digest);
    std::vector<uint8_t> bytes = OtaHeaderCodec::serialize(h);

    // Byte layout
    const uint8_t expected_prefix[] = {0x14, 0x17, 0x0B, 0x17, 0x01, 0x01, 0x2E, 0x00,
                                       0x01, 0x00, 0x00, 0x00, 0x78, 0x56, 0x34, 0x12};
    ok &= check(bytes.size() == OTA_HEADER_SIZE, "serialized header is not 32 bytes");
    ok &= check(std::memcmp(bytes.data(), expected_prefix, sizeof(expected_prefix)) == 0,
                "header prefix mismatch");
    ok &= check(std::memcmp(bytes.data() + 0x10, digest, OTA_DIGEST_SIZE) == 0,
                "digest not at offset 0x10");

    // Round trip
    OtaHeader parsed;
    ok &= check(OtaHeaderCodec::parse(bytes, parsed), "parse of 32 bytes failed");
    ok &= check(parsed == h, "parse(serialize(h)) != h");
    ok &= check(OtaHeaderCodec::hasValidMagic(parsed), "magic not recognised");

    // Parse ignores anything past the header
    std::vector<uint8_t> longer(bytes);
    longer.resize(100, 0xEE);
    OtaHeader parsed_long;
    ok &= check(OtaHeaderCodec::parse(longer, parsed_long), "parse with payload failed");
    ok &= check(parsed_long == h, "trailing bytes changed the parsed header");

    // Too small
    std::vector<uint8_t> short_bytes(bytes.begin(), bytes.begin() + 31);
    OtaHeader dummy;
    ok &= check(!OtaHeaderCodec::parse(short_bytes, dummy), "31 bytes parsed as a header");
    ok &= check(!OtaHeaderCodec::parse(nullptr, 32, dummy), "null buffer parsed as a header");

    // Parse does not judge magic; hasValidMagic does
    std::vector<uint8_t> zeros(OTA_HEADER_SIZE, 0);
    OtaHeader zero_header;
    ok &= check(OtaHeaderCodec::parse(zeros, zero_header), "parse rejected a zero header");
    ok &= check(!OtaHeaderCodec::hasValidMagic(zero_header), "zero magic accepted");

    // Custom info passes through parse unchanged
    bytes[0x08] = 0x7F;
    bytes[0x0B] = 0x42;
    OtaHeader custom;
    ok &= check(OtaHeaderCodec::parse(bytes, custom), "parse of custom info header failed");
    ok &= check(custom.custom_info[0] == 0x7F && custom.custom_info[3] == 0x42,
                "custom info not passed through");
    ok &= check(OtaHeaderCodec::serialize(custom) == bytes, "custom info lost on serialize");
    ok &= check(custom != h, "headers with different custom info compare equal");

    // Version masking
    FirmwareVersion wide;
    wide.major = 300;
    wide.minor = 256;
    wide.patch = 511;
    wide.board_type = 0x1234;
    OtaHeader masked = OtaHeaderCodec::makeHeader(wide, 0, digest);
    ok &= check(masked.version_major == 44, "300 not masked to 44");
    ok &= check(masked.version_minor == 0, "256 not masked to 0");
    ok &= check(masked.version_patch == 255, "511 not masked to 255");
    ok &= check(masked.board_type == 0x34, "board type not masked");

    // Full-range length survives as little-endian
    OtaHeader max_len = OtaHeaderCodec::makeHeader(version, 0xFFFFFFF0u, digest);
    std::vector<uint8_t> max_bytes = OtaHeaderCodec::serialize(max_len);
    ok &= check(max_bytes[0x0C] == 0xF0 && max_bytes[0x0F] == 0xFF, "length not little-endian");
    OtaHeader max_parsed;
    OtaHeaderCodec::parse(max_bytes, max_parsed);
    ok &= check(max_parsed.payload_length == 0xFFFFFFF0u, "large length did not round trip");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
