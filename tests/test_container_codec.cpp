#include "container_codec.hpp"
#include "archive_wrapper.hpp"
#include "block_padding.hpp"
#include "integrity_checker.hpp"
#include "hex_util.hpp"
#include <iostream>
#include <cstring>
#include <stdexcept>
#include <string>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static CipherKey testKey() {
    CipherKey key;
    for (int i = 0; i < CIPHER_KEY_SIZE; ++i) key.key[i] = static_cast<uint8_t>(i * 3 + 1);
    for (int i = 0; i < CIPHER_IV_SIZE; ++i) key.iv[i] = static_cast<uint8_t>(0xF0 - i);
    return key;
}

// Provider that always reports an error
class BrokenCipher : public CipherProvider {
public:
    size_t blockSize() const override { return 16; }
    std::string name() const override { return "broken"; }
    bool encrypt(const CipherKey&, const std::vector<uint8_t>&,
                 std::vector<uint8_t>&, std::string& error) const override {
        error = "hardware offline";
        return false;
    }
    bool decrypt(const CipherKey&, const std::vector<uint8_t>&,
                 std::vector<uint8_t>&, std::string& error) const override {
        error = "hardware offline";
        return false;
    }
};

int main() {
    bool ok = true;
    OtaContainerCodec codec(std::make_shared<AesCbcCipher>());
    CipherKey key = testKey();

    // ---- update.swu scenario ----
    std::string swu_text = "update.swu image contents";
    std::vector<uint8_t> swu(swu_text.begin(), swu_text.end());
    std::vector<uint8_t> archive;
    std::string error;
    ArchiveWrapper::wrapSingleEntry(swu, archive, error);

    FirmwareVersion version;
    version.major = 1;
    version.minor = 1;
    version.patch = 46;
    version.board_type = 0;

    CodecResult packed = codec.pack(archive, version, key);
    ok &= check(packed.success, "pack failed");

    const std::vector<uint8_t>& container = packed.data;
    const uint8_t prefix[] = {0x14, 0x17, 0x0B, 0x17, 0x01, 0x01, 0x2E, 0x00,
                              0x01, 0x00, 0x00, 0x00};
    ok &= check(container.size() == OTA_HEADER_SIZE + paddedSize(archive.size()),
                "container size is not header + padded archive");
    ok &= check(std::memcmp(container.data(), prefix, sizeof(prefix)) == 0, "header prefix");

    uint32_t declared = container[0x0C] | (container[0x0D] << 8) |
                        (container[0x0E] << 16) | ((uint32_t)container[0x0F] << 24);
    ok &= check(declared == container.size() - OTA_HEADER_SIZE, "declared payload length");

    uint8_t payload_md5[OTA_DIGEST_SIZE];
    IntegrityChecker::digest(container.data() + OTA_HEADER_SIZE,
                             container.size() - OTA_HEADER_SIZE, payload_md5);
    ok &= check(std::memcmp(container.data() + 0x10, payload_md5, OTA_DIGEST_SIZE) == 0,
                "digest is not MD5 of the encrypted payload");

    // Deterministic
    CodecResult packed_again = codec.pack(archive, version, key);
    ok &= check(packed_again.data == container, "pack is not deterministic");

    // Round trip up to padding
    CodecResult unpacked = codec.unpack(container, key);
    ok &= check(unpacked.success, "unpack failed");
    std::vector<uint8_t> padded_archive(archive);
    padToBlock(padded_archive);
    ok &= check(unpacked.data == padded_archive, "unpack != padToBlock(archive)");
    ok &= check(unpacked.header == packed.header, "unpacked header differs");

    std::vector<uint8_t> recovered;
    ok &= check(ArchiveWrapper::extractEntry(unpacked.data, "update/update.swu", recovered, error),
                "update/update.swu missing after unpack");
    ok &= check(recovered == swu, "update.swu content changed");

    // ---- Single-bit tamper anywhere in the payload ----
    std::vector<uint8_t> small_archive(20, 0xAB);
    CodecResult small = codec.pack(small_archive, version, key);
    ok &= check(small.success && small.data.size() == OTA_HEADER_SIZE + 32, "small pack");
    bool all_detected = true;
    for (size_t byte = OTA_HEADER_SIZE; byte < small.data.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> tampered(small.data);
            tampered[byte] ^= static_cast<uint8_t>(1 << bit);
            CodecResult r = codec.unpack(tampered, key);
            if (r.success || r.error != OtaError::INTEGRITY_MISMATCH || !r.data.empty()) {
                all_detected = false;
            }
        }
    }
    ok &= check(all_detected, "a payload bit flip went undetected");

    std::vector<uint8_t> bad_digest(small.data);
    bad_digest[0x1F] ^= 0x80;
    CodecResult digest_result = codec.unpack(bad_digest, key);
    ok &= check(digest_result.error == OtaError::INTEGRITY_MISMATCH, "stored digest tamper");
    ok &= check(digest_result.error_message.find("MD5 mismatch") != std::string::npos,
                "mismatch message names the check");
    uint8_t tampered_md5[OTA_DIGEST_SIZE];
    IntegrityChecker::digest(bad_digest.data() + OTA_HEADER_SIZE,
                             bad_digest.size() - OTA_HEADER_SIZE, tampered_md5);
    ok &= check(digest_result.error_message.find(
                    "stored=" + bytesToHex(bad_digest.data() + 0x10, OTA_DIGEST_SIZE) +
                    " calculated=" + bytesToHex(tampered_md5, OTA_DIGEST_SIZE)) != std::string::npos,
                "mismatch message lacks both digests");

    // ---- Magic ----
    std::vector<uint8_t> bad_magic(container);
    bad_magic[2] = 0x0C;
    CodecResult magic_result = codec.unpack(bad_magic, key);
    ok &= check(!magic_result.success && magic_result.error == OtaError::BAD_MAGIC, "bad magic");
    ok &= check(magic_result.error_message.find("14170c17") != std::string::npos,
                "bad magic message lacks the offending bytes");

    // ---- Too small ----
    std::vector<uint8_t> short_container(container.begin(), container.begin() + 31);
    ok &= check(codec.unpack(short_container, key).error == OtaError::TOO_SMALL, "31 bytes");
    ok &= check(codec.unpack(std::vector<uint8_t>(), key).error == OtaError::TOO_SMALL, "0 bytes");

    // ---- Unaligned payload with a valid digest ----
    std::vector<uint8_t> odd_payload(20, 0x5C);
    uint8_t odd_md5[OTA_DIGEST_SIZE];
    IntegrityChecker::digest(odd_payload, odd_md5);
    OtaHeader odd_header = OtaHeaderCodec::makeHeader(version, 20, odd_md5);
    std::vector<uint8_t> odd = OtaHeaderCodec::serialize(odd_header);
    odd.insert(odd.end(), odd_payload.begin(), odd_payload.end());
    ok &= check(codec.unpack(odd, key).error == OtaError::CIPHER_LENGTH, "unaligned payload");

    // ---- Declared length is informational ----
    std::vector<uint8_t> wrong_length(container);
    wrong_length[0x0C] ^= 0x10;
    CodecResult length_result = codec.unpack(wrong_length, key);
    ok &= check(length_result.success, "declared length mismatch rejected");
    ok &= check(length_result.data == padded_archive, "declared length changed the output");

    // ---- Version masking ----
    FirmwareVersion wide;
    wide.major = 300;
    CodecResult masked = codec.pack(archive, wide, key);
    ok &= check(masked.success && masked.data[4] == 44, "300 not stored as 44");

    // ---- Empty archive ----
    CodecResult empty = codec.pack(std::vector<uint8_t>(), version, key);
    ok &= check(empty.success && empty.data.size() == OTA_HEADER_SIZE, "empty container size");
    ok &= check(empty.header.payload_length == 0, "empty payload length");
    ok &= check(bytesToHex(empty.header.payload_digest, OTA_DIGEST_SIZE) ==
                "d41d8cd98f00b204e9800998ecf8427e", "empty payload digest");
    CodecResult empty_unpacked = codec.unpack(empty.data, key);
    ok &= check(empty_unpacked.success && empty_unpacked.data.empty(), "empty unpack");

    // ---- Wrong key is not detected by the format ----
    CipherKey other = testKey();
    other.key[31] ^= 0x01;
    CodecResult wrong_key = codec.unpack(container, other);
    ok &= check(wrong_key.success, "wrong key reported as error");
    ok &= check(wrong_key.data != padded_archive, "wrong key recovered the archive");

    // ---- Inspect ----
    CodecResult inspected = codec.inspect(container);
    ok &= check(inspected.success && inspected.data.empty(), "inspect of valid container");
    ok &= check(inspected.header.version_patch == 46, "inspect header");
    CodecResult inspected_bad = codec.inspect(bad_magic);
    ok &= check(!inspected_bad.success && inspected_bad.error == OtaError::BAD_MAGIC,
                "inspect of bad magic");
    ok &= check(inspected_bad.header.magic[2] == 0x0C, "inspect keeps the malformed header");

    // ---- Provider failures ----
    OtaContainerCodec broken(std::make_shared<BrokenCipher>());
    CodecResult broken_pack = broken.pack(archive, version, key);
    ok &= check(broken_pack.error == OtaError::CIPHER_PROVIDER_FAILURE, "broken encrypt");
    ok &= check(broken_pack.error_message.find("hardware offline") != std::string::npos,
                "provider diagnostic lost");
    ok &= check(broken.unpack(container, key).error == OtaError::CIPHER_PROVIDER_FAILURE,
                "broken decrypt");

    bool threw = false;
    try {
        OtaContainerCodec no_cipher(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, "null cipher provider accepted");

    ok &= check(getErrorString(OtaError::INTEGRITY_MISMATCH) == "INTEGRITY_MISMATCH",
                "error name");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
