/**
 * @file container_codec.hpp
 * @brief OTA Container Codec - pack/unpack of .bin firmware containers
 *
 * pack:   archive -> zero padding -> AES-256-CBC -> MD5 -> header || payload
 * unpack: container -> header -> magic -> MD5 -> AES-256-CBC -> archive
 *
 * Each call owns its buffers; a codec instance holds no per-call state and
 * may be shared between threads as long as its cipher provider can.
 *
 * @version 1.0
 */

#ifndef CONTAINER_CODEC_HPP
#define CONTAINER_CODEC_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "ota_error.hpp"
#include "ota_header.hpp"
#include "cipher_provider.hpp"

/**
 * @brief Outcome of a codec call
 */
struct CodecResult {
    bool success = false;
    OtaError error = OtaError::NONE;
    std::string error_message;      /* Which check failed and the offending values */
    OtaHeader header{};             /* Parsed or generated header */
    std::vector<uint8_t> data;      /* Container (pack) or decrypted archive (unpack) */
};

/**
 * @brief Container Codec Class
 */
class OtaContainerCodec {
public:
    /**
     * @brief Constructor
     * @param cipher Block cipher used for the payload
     */
    explicit OtaContainerCodec(std::shared_ptr<CipherProvider> cipher);

    /**
     * @brief Serialize an archive into a container
     * @param archive Zip archive bytes (already validated or wrapped)
     * @param version Firmware version and board (masked to 8 bits each)
     * @param key Encode-role key material
     */
    CodecResult pack(const std::vector<uint8_t>& archive,
                     const FirmwareVersion& version,
                     const CipherKey& key) const;

    /**
     * @brief Recover the archive from a container
     * @param container Full .bin contents
     * @param key Decode-role key material
     *
     * The returned archive keeps any trailing zero padding.
     */
    CodecResult unpack(const std::vector<uint8_t>& container,
                       const CipherKey& key) const;

    /**
     * @brief Parse the header and check the digest without decrypting
     *
     * Runs the same checks as unpack up to the digest. The header is
     * filled in whenever at least 32 bytes are present, so a malformed
     * container can still be printed.
     */
    CodecResult inspect(const std::vector<uint8_t>& container) const;

private:
    std::shared_ptr<CipherProvider> cipher_;

    /**
     * @brief Size, header, magic and digest checks shared by unpack/inspect
     */
    bool verifyContainer(const std::vector<uint8_t>& container, CodecResult& result) const;

    static void setError(CodecResult& result, OtaError error, const std::string& message);
};

#endif // CONTAINER_CODEC_HPP
