/**
 * @file firmware_tool.cpp
 * @brief Firmware Tool Implementation
 */

#include "firmware_tool.hpp"
#include "archive_wrapper.hpp"
#include "hex_util.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstring>
#include <algorithm>

static bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ==================== Constructor ====================

FirmwareTool::FirmwareTool(ConfigManager& config)
    : config_(config),
      initialized_(false),
      last_error_(OtaError::NONE) {
    std::memset(&encode_key_, 0, sizeof(CipherKey));
    std::memset(&decode_key_, 0, sizeof(CipherKey));
}

bool FirmwareTool::initialize() {
    resetError();

    if (!config_.getCipherKey(KeyRole::ENCODE, encode_key_) ||
        !config_.getCipherKey(KeyRole::DECODE, decode_key_)) {
        return reportError(OtaError::CONFIG_ERROR, "Invalid cipher key material");
    }

    codec_ = std::make_unique<OtaContainerCodec>(std::make_shared<AesCbcCipher>());
    initialized_ = true;

    if (config_.isVerbose()) {
        std::cout << "[TOOL] Entry name: " << config_.getEntryName() << "\n";
        std::cout << "[TOOL] Compression: "
                  << (config_.getCompressionMethod() == CompressionMethod::DEFLATE ? "deflate" : "store")
                  << "\n";
    }
    return true;
}

// ==================== Encode ====================

bool FirmwareTool::loadArchive(const std::string& input_path, std::vector<uint8_t>& archive) {
    std::vector<uint8_t> input;
    if (!readFile(input_path, input)) {
        return false;
    }

    if (endsWith(input_path, ".swu")) {
        std::cout << "[TOOL] Wrapping " << input_path << " into a ZIP archive...\n";
        std::string error;
        if (!ArchiveWrapper::wrapSingleEntry(input, archive, error,
                                             config_.getEntryName(),
                                             config_.getCompressionMethod())) {
            return reportError(OtaError::ARCHIVE_FORMAT, "Failed to wrap " + input_path + ": " + error);
        }
        return true;
    }

    if (!ArchiveWrapper::looksLikeArchive(input)) {
        size_t shown = std::min<size_t>(input.size(), 4);
        return reportError(OtaError::NOT_AN_ARCHIVE,
                           "Input file does not look like a ZIP (magic=" +
                           bytesToHex(input.data(), shown) + ")");
    }

    if (!ArchiveWrapper::hasEntry(input, config_.getEntryName())) {
        std::cout << "[TOOL] ⚠️  Archive has no " << config_.getEntryName()
                  << " entry; the device will not find the update\n";
    }

    archive.swap(input);
    return true;
}

bool FirmwareTool::encode(const std::string& input_path,
                          const std::string& output_path,
                          const FirmwareVersion& version) {
    resetError();
    if (!initialized_) {
        return reportError(OtaError::CONFIG_ERROR, "Firmware tool not initialized");
    }

    std::cout << "\n[TOOL] ========================================\n";
    std::cout << "[TOOL] Encoding " << input_path << " -> " << output_path << "\n";
    std::cout << "[TOOL] ========================================\n";

    // Step 1: Obtain ZIP bytes
    std::vector<uint8_t> archive;
    if (!loadArchive(input_path, archive)) {
        return false;
    }

    if (config_.isVerbose()) {
        std::vector<ArchiveEntryInfo> entries;
        std::string error;
        if (ArchiveWrapper::listEntries(archive, entries, error)) {
            ArchiveWrapper::printSummary(entries);
        }
    }

    // Step 2: Pad, encrypt, digest, header
    CodecResult result = codec_->pack(archive, version, encode_key_);
    if (!result.success) {
        return reportError(result.error, result.error_message);
    }

    // Step 3: Write output
    if (!writeFile(output_path, result.data)) {
        return false;
    }

    std::cout << "[TOOL] ✓ Written: " << output_path << " (" << result.data.size() << " bytes)\n";
    return true;
}

// ==================== Decode ====================

bool FirmwareTool::decode(const std::string& input_path,
                          const std::string& output_path,
                          bool trim) {
    resetError();
    if (!initialized_) {
        return reportError(OtaError::CONFIG_ERROR, "Firmware tool not initialized");
    }

    std::cout << "\n[TOOL] ========================================\n";
    std::cout << "[TOOL] Decoding " << input_path << " -> " << output_path << "\n";
    std::cout << "[TOOL] ========================================\n";

    std::vector<uint8_t> container;
    if (!readFile(input_path, container)) {
        return false;
    }

    CodecResult result = codec_->unpack(container, decode_key_);
    if (!result.success) {
        return reportError(result.error, result.error_message);
    }

    std::cout << "[TOOL] Version: " << (int)result.header.version_major << "."
              << (int)result.header.version_minor << "."
              << (int)result.header.version_patch
              << "  board=" << (int)result.header.board_type << "\n";
    std::cout << "[TOOL] Enc len: " << result.header.payload_length << " bytes (file has "
              << (container.size() - OTA_HEADER_SIZE) << " bytes)\n";

    // A wrong key still decrypts, only the zip signature gives it away
    if (!result.data.empty() && !ArchiveWrapper::looksLikeArchive(result.data)) {
        size_t shown = std::min<size_t>(result.data.size(), 4);
        std::cerr << "[TOOL] ⚠️  Decrypted payload is not a ZIP (magic="
                  << bytesToHex(result.data.data(), shown)
                  << "); check cipher.decode_key\n";
    }

    if (trim) {
        size_t length = 0;
        std::string error;
        if (!ArchiveWrapper::archiveLength(result.data, length, error)) {
            return reportError(OtaError::ARCHIVE_FORMAT,
                               "Cannot trim padding, archive end not found: " + error);
        }
        std::cout << "[TOOL] Trimmed " << (result.data.size() - length) << " padding bytes\n";
        result.data.resize(length);
    }

    if (config_.isVerbose()) {
        std::vector<ArchiveEntryInfo> entries;
        std::string error;
        if (ArchiveWrapper::listEntries(result.data, entries, error)) {
            ArchiveWrapper::printSummary(entries);
        } else {
            std::cout << "[TOOL] ⚠️  Central directory unreadable: " << error << "\n";
        }
    }

    if (!writeFile(output_path, result.data)) {
        return false;
    }

    std::cout << "[TOOL] ✓ Decrypted: " << output_path << " (" << result.data.size() << " bytes)\n";
    return true;
}

// ==================== Info ====================

bool FirmwareTool::info(const std::string& input_path) {
    resetError();
    if (!initialized_) {
        return reportError(OtaError::CONFIG_ERROR, "Firmware tool not initialized");
    }

    std::vector<uint8_t> container;
    if (!readFile(input_path, container)) {
        return false;
    }

    CodecResult result = codec_->inspect(container);
    if (container.size() >= OTA_HEADER_SIZE) {
        OtaHeaderCodec::printSummary(result.header, container.size() - OTA_HEADER_SIZE);
    }

    if (!result.success) {
        return reportError(result.error, result.error_message);
    }

    std::cout << "[TOOL] ✓ Container is intact\n";
    return true;
}

// ==================== File I/O ====================

bool FirmwareTool::readFile(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return reportError(OtaError::IO_ERROR, "Input file not found: " + path);
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size < 0) {
        return reportError(OtaError::IO_ERROR, "Failed to determine size of " + path);
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!buffer.empty()) {
        file.read(reinterpret_cast<char*>(buffer.data()), size);
        if (!file.good()) {
            return reportError(OtaError::IO_ERROR, "Failed to read " + path);
        }
    }

    data.swap(buffer);
    return true;
}

bool FirmwareTool::writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return reportError(OtaError::IO_ERROR, "Failed to create output file: " + path);
    }

    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    file.close();
    if (file.fail()) {
        std::remove(path.c_str());
        return reportError(OtaError::IO_ERROR, "Failed to write " + path);
    }
    return true;
}

// ==================== Error Reporting ====================

bool FirmwareTool::reportError(OtaError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    std::cerr << "[TOOL] ✗ " << getErrorString(error) << ": " << message << "\n";
    return false;
}

void FirmwareTool::resetError() {
    last_error_ = OtaError::NONE;
    last_error_message_.clear();
}
