/**
 * @file config_manager.hpp
 * @brief Configuration Management Module
 *
 * Optional JSON configuration for ccota. Every value has a built-in
 * default, so the tool works without a config file; a file only needs to
 * list the settings it overrides.
 */

#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "cipher_provider.hpp"
#include "archive_wrapper.hpp"
#include "ota_header.hpp"

// ==================== Defaults ====================

// AES-256-CBC key material embedded in the printer firmware (public).
// The two keys differ only in their last bytes; each is kept for its role.
#define DEFAULT_ENCODE_KEY_HEX  "78B6A614B6B6E361DC84D705B7FDDA33C967DDF2970A689F8156F78EFE0B1FCE"
#define DEFAULT_DECODE_KEY_HEX  "78B6A614B6B6E361DC84D705B7FDDA33C967DDF2970A689F8156F78EFE0B0928"
#define DEFAULT_IV_HEX          "54E37626B9A699403064111F77858049"

/**
 * @brief Which direction a key is used for
 */
enum class KeyRole : uint8_t {
    ENCODE = 0,
    DECODE = 1
};

/**
 * @brief Configuration Manager Class
 */
class ConfigManager {
public:
    /**
     * @brief Constructor
     * @param config_file Path to config JSON (empty: defaults only)
     */
    explicit ConfigManager(const std::string& config_file = "");

    /**
     * @brief Load configuration from file
     * @return true if successful, false otherwise
     */
    bool load();

    /**
     * @brief Check if a configuration file was loaded
     */
    bool isLoaded() const { return loaded_; }

    // ========================================
    // Cipher Configuration
    // ========================================

    std::string getEncodeKeyHex() const;
    std::string getDecodeKeyHex() const;
    std::string getIvHex() const;

    /**
     * @brief Decode key material for a role
     * @param role Encode or decode
     * @param key Output key + IV
     * @return false if the configured hex is malformed
     */
    bool getCipherKey(KeyRole role, CipherKey& key) const;

    // ========================================
    // Archive Configuration
    // ========================================

    std::string getEntryName() const;
    CompressionMethod getCompressionMethod() const;

    // ========================================
    // Firmware Defaults
    // ========================================

    FirmwareVersion getDefaultVersion() const;

    // ========================================
    // Decode Configuration
    // ========================================

    bool trimPadding() const;

    // ========================================
    // Logging Configuration
    // ========================================

    bool isVerbose() const;

    const nlohmann::json& getRawConfig() const { return config_; }

private:
    std::string config_file_;
    nlohmann::json config_;
    bool loaded_;

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& fallback) const;
    unsigned int getUnsigned(const std::string& section, const std::string& key,
                             unsigned int fallback) const;
    bool getBool(const std::string& section, const std::string& key, bool fallback) const;
};

#endif // CONFIG_MANAGER_HPP
