/**
 * @file config_manager.cpp
 * @brief Configuration Management Module Implementation
 */

#include "config_manager.hpp"
#include "hex_util.hpp"
#include <fstream>
#include <iostream>
#include <cstring>
#include <stdexcept>

ConfigManager::ConfigManager(const std::string& config_file)
    : config_file_(config_file), config_(nlohmann::json::object()), loaded_(false) {
}

bool ConfigManager::load() {
    if (config_file_.empty()) {
        std::cout << "[CONFIG] No config file, using built-in defaults" << std::endl;
        return true;
    }

    std::ifstream file(config_file_);
    if (!file.is_open()) {
        std::cerr << "[CONFIG] Failed to open: " << config_file_ << std::endl;
        return false;
    }

    nlohmann::json parsed;
    try {
        file >> parsed;
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] Parse error: " << e.what() << std::endl;
        return false;
    }

    if (!parsed.is_object()) {
        std::cerr << "[CONFIG] Top level of " << config_file_ << " must be an object" << std::endl;
        return false;
    }

    // Touch every setting once so type errors surface here, not mid-run
    nlohmann::json previous = config_;
    config_ = parsed;
    try {
        CipherKey key;
        if (!getCipherKey(KeyRole::ENCODE, key) || !getCipherKey(KeyRole::DECODE, key)) {
            config_ = previous;
            return false;
        }
        getEntryName();
        getCompressionMethod();
        getDefaultVersion();
        trimPadding();
        isVerbose();
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] Invalid setting: " << e.what() << std::endl;
        config_ = previous;
        return false;
    }

    loaded_ = true;
    std::cout << "[CONFIG] ✓ Loaded from " << config_file_ << std::endl;
    return true;
}

// ========================================
// Cipher Configuration
// ========================================

std::string ConfigManager::getEncodeKeyHex() const {
    return getString("cipher", "encode_key", DEFAULT_ENCODE_KEY_HEX);
}

std::string ConfigManager::getDecodeKeyHex() const {
    return getString("cipher", "decode_key", DEFAULT_DECODE_KEY_HEX);
}

std::string ConfigManager::getIvHex() const {
    return getString("cipher", "iv", DEFAULT_IV_HEX);
}

bool ConfigManager::getCipherKey(KeyRole role, CipherKey& key) const {
    const char* role_name = (role == KeyRole::ENCODE) ? "encode_key" : "decode_key";
    std::string key_hex = (role == KeyRole::ENCODE) ? getEncodeKeyHex() : getDecodeKeyHex();

    std::vector<uint8_t> key_bytes;
    if (!hexToBytes(key_hex, key_bytes) || key_bytes.size() != CIPHER_KEY_SIZE) {
        std::cerr << "[CONFIG] ✗ cipher." << role_name << " must be "
                  << CIPHER_KEY_SIZE * 2 << " hex characters" << std::endl;
        return false;
    }

    std::vector<uint8_t> iv_bytes;
    if (!hexToBytes(getIvHex(), iv_bytes) || iv_bytes.size() != CIPHER_IV_SIZE) {
        std::cerr << "[CONFIG] ✗ cipher.iv must be "
                  << CIPHER_IV_SIZE * 2 << " hex characters" << std::endl;
        return false;
    }

    std::memcpy(key.key, key_bytes.data(), CIPHER_KEY_SIZE);
    std::memcpy(key.iv, iv_bytes.data(), CIPHER_IV_SIZE);
    return true;
}

// ========================================
// Archive Configuration
// ========================================

std::string ConfigManager::getEntryName() const {
    return getString("archive", "entry_name", ARCHIVE_DEFAULT_ENTRY);
}

CompressionMethod ConfigManager::getCompressionMethod() const {
    std::string method = getString("archive", "compression", "deflate");
    if (method == "deflate") {
        return CompressionMethod::DEFLATE;
    }
    if (method == "store") {
        return CompressionMethod::STORE;
    }
    throw std::invalid_argument("archive.compression must be \"deflate\" or \"store\", got \"" +
                                method + "\"");
}

// ========================================
// Firmware Defaults
// ========================================

FirmwareVersion ConfigManager::getDefaultVersion() const {
    FirmwareVersion version;
    version.major = getUnsigned("firmware", "major", 0);
    version.minor = getUnsigned("firmware", "minor", 0);
    version.patch = getUnsigned("firmware", "patch", 0);
    version.board_type = getUnsigned("firmware", "board_type", 0);
    return version;
}

// ========================================
// Decode Configuration
// ========================================

bool ConfigManager::trimPadding() const {
    return getBool("decode", "trim_padding", false);
}

// ========================================
// Logging Configuration
// ========================================

bool ConfigManager::isVerbose() const {
    return getBool("logging", "verbose", false);
}

// ========================================
// Helper Functions
// ========================================

std::string ConfigManager::getString(const std::string& section, const std::string& key,
                                     const std::string& fallback) const {
    if (!config_.contains(section) || !config_[section].contains(key)) {
        return fallback;
    }
    return config_[section][key].get<std::string>();
}

unsigned int ConfigManager::getUnsigned(const std::string& section, const std::string& key,
                                        unsigned int fallback) const {
    if (!config_.contains(section) || !config_[section].contains(key)) {
        return fallback;
    }
    return config_[section][key].get<unsigned int>();
}

bool ConfigManager::getBool(const std::string& section, const std::string& key, bool fallback) const {
    if (!config_.contains(section) || !config_[section].contains(key)) {
        return fallback;
    }
    return config_[section][key].get<bool>();
}
