/**
 * @file archive_wrapper.hpp
 * @brief Zip archive convention for OTA payloads
 *
 * The payload of a container is a zip archive carrying update/update.swu.
 * This module writes single-entry archives (deflate or store) and reads
 * back the central directory, tolerating trailing bytes after the
 * end-of-central-directory record (the cipher zero padding).
 *
 * Not supported: zip64, multi-disk archives, encrypted entries.
 *
 * @version 1.0
 */

#ifndef ARCHIVE_WRAPPER_HPP
#define ARCHIVE_WRAPPER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// ==================== Constants ====================

#define ARCHIVE_DEFAULT_ENTRY       "update/update.swu"

#define ZIP_LOCAL_HEADER_SIG        0x04034B50  // "PK\3\4"
#define ZIP_CENTRAL_HEADER_SIG      0x02014B50  // "PK\1\2"
#define ZIP_END_OF_CENTRAL_SIG      0x06054B50  // "PK\5\6"

#define ZIP_LOCAL_HEADER_SIZE       30
#define ZIP_CENTRAL_HEADER_SIZE     46
#define ZIP_END_OF_CENTRAL_SIZE     22
#define ZIP_MAX_COMMENT_SIZE        0xFFFF

/**
 * @brief Entry storage method
 */
enum class CompressionMethod : uint16_t {
    STORE = 0,
    DEFLATE = 8
};

/**
 * @brief Central directory record of one entry
 */
struct ArchiveEntryInfo {
    std::string name;
    uint16_t flags;
    uint16_t method;
    uint32_t crc32;
    uint32_t compressed_size;
    uint32_t uncompressed_size;
    uint32_t local_header_offset;
};

/**
 * @brief Archive Wrapper Class
 */
class ArchiveWrapper {
public:
    /**
     * @brief Build a zip archive holding exactly one entry
     * @param raw Entry content
     * @param archive Output archive bytes
     * @param error Diagnostic on failure
     * @param entry_name Path of the entry inside the archive
     * @param method Storage method
     * @return true if successful
     *
     * Output is deterministic: DOS timestamp 1980-01-01 00:00:00,
     * file mode 0644.
     */
    static bool wrapSingleEntry(const std::vector<uint8_t>& raw,
                                std::vector<uint8_t>& archive,
                                std::string& error,
                                const std::string& entry_name = ARCHIVE_DEFAULT_ENTRY,
                                CompressionMethod method = CompressionMethod::DEFLATE);

    /**
     * @brief Check the local file header signature ("PK")
     */
    static bool looksLikeArchive(const std::vector<uint8_t>& bytes);

    /**
     * @brief Read the central directory
     */
    static bool listEntries(const std::vector<uint8_t>& archive,
                            std::vector<ArchiveEntryInfo>& entries,
                            std::string& error);

    /**
     * @brief Check whether an entry with this exact name exists
     */
    static bool hasEntry(const std::vector<uint8_t>& archive, const std::string& name);

    /**
     * @brief Decompress one entry and verify its CRC-32
     */
    static bool extractEntry(const std::vector<uint8_t>& archive,
                             const std::string& name,
                             std::vector<uint8_t>& content,
                             std::string& error);

    /**
     * @brief Offset one past the end-of-central-directory record
     *
     * This is the archive's own end-of-data marker; anything after it
     * (e.g. cipher zero padding) is not part of the archive.
     */
    static bool archiveLength(const std::vector<uint8_t>& archive,
                              size_t& length,
                              std::string& error);

    /**
     * @brief Print central directory (diagnostics)
     */
    static void printSummary(const std::vector<ArchiveEntryInfo>& entries);

private:
    static bool findEndOfCentralDirectory(const std::vector<uint8_t>& archive,
                                          size_t& eocd_offset,
                                          std::string& error);

    static bool deflateRaw(const std::vector<uint8_t>& input,
                           std::vector<uint8_t>& output,
                           std::string& error);

    static bool inflateRaw(const uint8_t* input, size_t input_size,
                           size_t expected_size,
                           std::vector<uint8_t>& output,
                           std::string& error);
};

#endif // ARCHIVE_WRAPPER_HPP
