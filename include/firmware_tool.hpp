/**
 * @file firmware_tool.hpp
 * @brief Firmware Tool - file-level encode/decode/info commands
 *
 * Reads input files, prepares the archive (wrapping raw .swu files),
 * drives the container codec and writes the result. Output files are
 * written only once every step has succeeded.
 */

#ifndef FIRMWARE_TOOL_HPP
#define FIRMWARE_TOOL_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "config_manager.hpp"
#include "container_codec.hpp"
#include "ota_error.hpp"

/**
 * @brief Firmware Tool Class
 */
class FirmwareTool {
public:
    /**
     * @brief Constructor
     * @param config Configuration manager
     */
    explicit FirmwareTool(ConfigManager& config);

    /**
     * @brief Resolve key material and set up the codec
     * @return true if successful
     */
    bool initialize();

    /**
     * @brief Pack a .swu or .zip into a .bin container
     * @param input_path Raw update.swu or zip archive
     * @param output_path Container to write
     * @param version Firmware version and board
     */
    bool encode(const std::string& input_path,
                const std::string& output_path,
                const FirmwareVersion& version);

    /**
     * @brief Unpack a .bin container into its zip archive
     * @param trim Cut trailing cipher padding at the archive's end record
     */
    bool decode(const std::string& input_path,
                const std::string& output_path,
                bool trim);

    /**
     * @brief Print header diagnostics and verify the digest
     */
    bool info(const std::string& input_path);

    OtaError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }

private:
    ConfigManager& config_;
    std::unique_ptr<OtaContainerCodec> codec_;
    CipherKey encode_key_;
    CipherKey decode_key_;
    bool initialized_;

    OtaError last_error_;
    std::string last_error_message_;

    /**
     * @brief Obtain zip bytes from the encode input
     */
    bool loadArchive(const std::string& input_path, std::vector<uint8_t>& archive);

    bool readFile(const std::string& path, std::vector<uint8_t>& data);
    bool writeFile(const std::string& path, const std::vector<uint8_t>& data);

    /**
     * @brief Record and print an error
     * @return always false
     */
    bool reportError(OtaError error, const std::string& message);

    void resetError();
};

#endif // FIRMWARE_TOOL_HPP
