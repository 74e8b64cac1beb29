/**
 * @file container_codec.cpp
 * @brief OTA Container Codec Implementation
 */

#include "container_codec.hpp"
#include "block_padding.hpp"
#include "integrity_checker.hpp"
#include "hex_util.hpp"
#include <iostream>
#include <stdexcept>

// ==================== Constructor ====================

OtaContainerCodec::OtaContainerCodec(std::shared_ptr<CipherProvider> cipher)
    : cipher_(cipher) {
    if (!cipher_) {
        throw std::invalid_argument("OtaContainerCodec requires a cipher provider");
    }
}

void OtaContainerCodec::setError(CodecResult& result, OtaError error, const std::string& message) {
    result.success = false;
    result.error = error;
    result.error_message = message;
    result.data.clear();
    std::cerr << "[CODEC] ✗ " << getErrorString(error) << ": " << message << "\n";
}

// ==================== Pack ====================

CodecResult OtaContainerCodec::pack(const std::vector<uint8_t>& archive,
                                    const FirmwareVersion& version,
                                    const CipherKey& key) const {
    CodecResult result;

    // Step 1: Pad to cipher block size
    std::vector<uint8_t> padded(archive);
    padToBlock(padded, cipher_->blockSize());
    std::cout << "[CODEC] ZIP size: " << archive.size() << " bytes ("
              << padded.size() << " after padding)\n";

    if (padded.size() > 0xFFFFFFFFull) {
        setError(result, OtaError::PAYLOAD_TOO_LARGE,
                 "Payload of " + std::to_string(padded.size()) +
                 " bytes does not fit the 32-bit length field");
        return result;
    }

    // Step 2: Encrypt
    std::vector<uint8_t> encrypted;
    std::string cipher_error;
    if (!cipher_->encrypt(key, padded, encrypted, cipher_error)) {
        setError(result, OtaError::CIPHER_PROVIDER_FAILURE,
                 cipher_->name() + " encryption failed: " + cipher_error);
        return result;
    }
    if (encrypted.size() != padded.size()) {
        setError(result, OtaError::CIPHER_PROVIDER_FAILURE,
                 cipher_->name() + " returned " + std::to_string(encrypted.size()) +
                 " bytes for " + std::to_string(padded.size()) + " plaintext bytes");
        return result;
    }

    // Step 3: Digest over the payload as it will appear on disk
    uint8_t digest[OTA_DIGEST_SIZE];
    if (!IntegrityChecker::digest(encrypted, digest)) {
        setError(result, OtaError::CIPHER_PROVIDER_FAILURE, "MD5 computation failed");
        return result;
    }

    // Step 4: Header || payload
    result.header = OtaHeaderCodec::makeHeader(version, static_cast<uint32_t>(encrypted.size()), digest);

    std::vector<uint8_t> container = OtaHeaderCodec::serialize(result.header);
    container.insert(container.end(), encrypted.begin(), encrypted.end());

    std::cout << "[CODEC] Version: " << (int)result.header.version_major << "."
              << (int)result.header.version_minor << "."
              << (int)result.header.version_patch
              << "  board=" << (int)result.header.board_type << "\n";
    std::cout << "[CODEC] Enc size: " << encrypted.size() << " bytes\n";
    std::cout << "[CODEC] MD5: " << bytesToHex(digest, OTA_DIGEST_SIZE) << "\n";
    std::cout << "[CODEC] ✓ Container packed (" << container.size() << " bytes)\n";

    result.data.swap(container);
    result.success = true;
    return result;
}

// ==================== Unpack ====================

bool OtaContainerCodec::verifyContainer(const std::vector<uint8_t>& container,
                                        CodecResult& result) const {
    // Step 1: Minimum size
    if (container.size() < OTA_HEADER_SIZE) {
        setError(result, OtaError::TOO_SMALL,
                 "File too small: " + std::to_string(container.size()) +
                 " bytes (header is " + std::to_string(OTA_HEADER_SIZE) + ")");
        return false;
    }

    // Step 2: Header
    if (!OtaHeaderCodec::parse(container, result.header)) {
        setError(result, OtaError::TOO_SMALL, "Header parse failed");
        return false;
    }

    // Step 3: Magic
    if (!OtaHeaderCodec::hasValidMagic(result.header)) {
        setError(result, OtaError::BAD_MAGIC,
                 "Bad magic: " + bytesToHex(result.header.magic, OTA_MAGIC_SIZE) +
                 " (expected " + bytesToHex(OTA_MAGIC, OTA_MAGIC_SIZE) + ")");
        return false;
    }
    std::cout << "[CODEC] ✓ Magic valid: " << bytesToHex(OTA_MAGIC, OTA_MAGIC_SIZE) << "\n";

    // Step 4: Payload. Declared length is informational only.
    const uint8_t* payload = container.data() + OTA_HEADER_SIZE;
    size_t payload_size = container.size() - OTA_HEADER_SIZE;
    if (result.header.payload_length != payload_size) {
        std::cout << "[CODEC] ⚠️  Enc len: " << result.header.payload_length
                  << " bytes declared, file has " << payload_size << " bytes\n";
    }

    // Step 5: Integrity, before any decryption attempt
    uint8_t calculated[OTA_DIGEST_SIZE];
    DigestCheck digest_check = IntegrityChecker::verify(payload, payload_size,
                                                        result.header.payload_digest, calculated);
    if (digest_check == DigestCheck::FAILED) {
        setError(result, OtaError::CIPHER_PROVIDER_FAILURE, "MD5 computation failed");
        return false;
    }
    if (digest_check == DigestCheck::MISMATCH) {
        setError(result, OtaError::INTEGRITY_MISMATCH,
                 "MD5 mismatch: stored=" +
                 bytesToHex(result.header.payload_digest, OTA_DIGEST_SIZE) +
                 " calculated=" + bytesToHex(calculated, OTA_DIGEST_SIZE));
        return false;
    }
    std::cout << "[CODEC] ✓ MD5 OK: " << bytesToHex(calculated, OTA_DIGEST_SIZE) << "\n";

    return true;
}

CodecResult OtaContainerCodec::unpack(const std::vector<uint8_t>& container,
                                      const CipherKey& key) const {
    CodecResult result;

    if (!verifyContainer(container, result)) {
        return result;
    }

    std::vector<uint8_t> payload(container.begin() + OTA_HEADER_SIZE, container.end());

    // Step 6: Decrypt (block-aligned payloads only)
    if (payload.size() % cipher_->blockSize() != 0) {
        setError(result, OtaError::CIPHER_LENGTH,
                 "Payload length " + std::to_string(payload.size()) +
                 " is not a multiple of the " + std::to_string(cipher_->blockSize()) +
                 "-byte block size");
        return result;
    }

    std::vector<uint8_t> decrypted;
    std::string cipher_error;
    if (!cipher_->decrypt(key, payload, decrypted, cipher_error)) {
        setError(result, OtaError::CIPHER_PROVIDER_FAILURE,
                 cipher_->name() + " decryption failed: " + cipher_error);
        return result;
    }

    // Step 7: Trailing zero padding stays in place
    std::cout << "[CODEC] ✓ Decrypted " << decrypted.size() << " bytes\n";

    result.data.swap(decrypted);
    result.success = true;
    return result;
}

CodecResult OtaContainerCodec::inspect(const std::vector<uint8_t>& container) const {
    CodecResult result;
    if (verifyContainer(container, result)) {
        result.success = true;
    }
    return result;
}
