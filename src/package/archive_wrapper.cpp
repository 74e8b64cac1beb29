/**
 * @file archive_wrapper.cpp
 * @brief Zip archive writer/reader for OTA payloads (zlib)
 */

#include "archive_wrapper.hpp"
#include "block_padding.hpp"
#include <iostream>
#include <cstring>
#include <zlib.h>

// DOS date/time for 1980-01-01 00:00:00
#define ZIP_FIXED_DOS_DATE      0x0021
#define ZIP_FIXED_DOS_TIME      0x0000

#define ZIP_VERSION_STORE       10          // 1.0
#define ZIP_VERSION_DEFLATE     20          // 2.0
#define ZIP_VERSION_MADE_BY     ((3 << 8) | 20)         // UNIX, 2.0
#define ZIP_EXTERNAL_ATTR       (0100644u << 16)        // -rw-r--r--

#define ZIP_FLAG_ENCRYPTED      0x0001

// ==================== Little-endian helpers ====================

static void putU16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void putU32(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ==================== zlib wrappers ====================

bool ArchiveWrapper::deflateRaw(const std::vector<uint8_t>& input,
                                std::vector<uint8_t>& output,
                                std::string& error) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Negative window bits: raw deflate stream, as stored in zip entries
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        error = "deflateInit2 failed";
        return false;
    }

    std::vector<uint8_t> result(deflateBound(&strm, static_cast<uLong>(input.size())) + 16);

    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = deflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        error = std::string("deflate failed: ") + (strm.msg ? strm.msg : std::to_string(ret));
        deflateEnd(&strm);
        return false;
    }

    result.resize(strm.total_out);
    deflateEnd(&strm);
    output.swap(result);
    return true;
}

bool ArchiveWrapper::inflateRaw(const uint8_t* input, size_t input_size,
                                size_t expected_size,
                                std::vector<uint8_t>& output,
                                std::string& error) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        error = "inflateInit2 failed";
        return false;
    }

    // One spare byte detects entries that inflate past their declared size
    std::vector<uint8_t> result(expected_size + 1);

    strm.next_in = const_cast<Bytef*>(input);
    strm.avail_in = static_cast<uInt>(input_size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = inflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        error = std::string("inflate failed: ") + (strm.msg ? strm.msg : std::to_string(ret));
        inflateEnd(&strm);
        return false;
    }

    size_t produced = strm.total_out;
    inflateEnd(&strm);

    if (produced != expected_size) {
        error = "inflated size " + std::to_string(produced) +
                " differs from declared " + std::to_string(expected_size);
        return false;
    }

    result.resize(produced);
    output.swap(result);
    return true;
}

// ==================== Writer ====================

bool ArchiveWrapper::wrapSingleEntry(const std::vector<uint8_t>& raw,
                                     std::vector<uint8_t>& archive,
                                     std::string& error,
                                     const std::string& entry_name,
                                     CompressionMethod method) {
    if (entry_name.empty() || entry_name.size() > 0xFFFF) {
        error = "invalid entry name length: " + std::to_string(entry_name.size());
        return false;
    }
    if (raw.size() >= 0xFFFFFFFFull) {
        error = "entry of " + std::to_string(raw.size()) + " bytes requires zip64 (unsupported)";
        return false;
    }

    uint32_t crc = static_cast<uint32_t>(crc32(0L, raw.data(), static_cast<uInt>(raw.size())));

    std::vector<uint8_t> deflated;
    const std::vector<uint8_t>* data = &raw;
    if (method == CompressionMethod::DEFLATE) {
        if (!deflateRaw(raw, deflated, error)) {
            return false;
        }
        data = &deflated;
    }

    uint16_t version_needed = (method == CompressionMethod::DEFLATE) ? ZIP_VERSION_DEFLATE
                                                                     : ZIP_VERSION_STORE;
    uint16_t name_len = static_cast<uint16_t>(entry_name.size());
    uint32_t compressed_size = static_cast<uint32_t>(data->size());
    uint32_t uncompressed_size = static_cast<uint32_t>(raw.size());

    std::vector<uint8_t> out;
    out.reserve(ZIP_LOCAL_HEADER_SIZE + ZIP_CENTRAL_HEADER_SIZE + ZIP_END_OF_CENTRAL_SIZE +
                2 * entry_name.size() + data->size());

    // Local file header
    putU32(out, ZIP_LOCAL_HEADER_SIG);
    putU16(out, version_needed);
    putU16(out, 0);                                 // flags
    putU16(out, static_cast<uint16_t>(method));
    putU16(out, ZIP_FIXED_DOS_TIME);
    putU16(out, ZIP_FIXED_DOS_DATE);
    putU32(out, crc);
    putU32(out, compressed_size);
    putU32(out, uncompressed_size);
    putU16(out, name_len);
    putU16(out, 0);                                 // extra length
    out.insert(out.end(), entry_name.begin(), entry_name.end());
    out.insert(out.end(), data->begin(), data->end());

    // Central directory
    uint32_t central_offset = static_cast<uint32_t>(out.size());
    putU32(out, ZIP_CENTRAL_HEADER_SIG);
    putU16(out, ZIP_VERSION_MADE_BY);
    putU16(out, version_needed);
    putU16(out, 0);                                 // flags
    putU16(out, static_cast<uint16_t>(method));
    putU16(out, ZIP_FIXED_DOS_TIME);
    putU16(out, ZIP_FIXED_DOS_DATE);
    putU32(out, crc);
    putU32(out, compressed_size);
    putU32(out, uncompressed_size);
    putU16(out, name_len);
    putU16(out, 0);                                 // extra length
    putU16(out, 0);                                 // comment length
    putU16(out, 0);                                 // disk number start
    putU16(out, 0);                                 // internal attributes
    putU32(out, ZIP_EXTERNAL_ATTR);
    putU32(out, 0);                                 // local header offset
    out.insert(out.end(), entry_name.begin(), entry_name.end());
    uint32_t central_size = static_cast<uint32_t>(out.size()) - central_offset;

    if (out.size() >= 0xFFFFFFFFull) {
        error = "archive exceeds 4 GiB (zip64 unsupported)";
        return false;
    }

    // End of central directory
    putU32(out, ZIP_END_OF_CENTRAL_SIG);
    putU16(out, 0);                                 // this disk
    putU16(out, 0);                                 // central directory disk
    putU16(out, 1);                                 // entries on this disk
    putU16(out, 1);                                 // total entries
    putU32(out, central_size);
    putU32(out, central_offset);
    putU16(out, 0);                                 // comment length

    archive.swap(out);
    return true;
}

bool ArchiveWrapper::looksLikeArchive(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 2 && bytes[0] == 'P' && bytes[1] == 'K';
}

// ==================== Reader ====================

bool ArchiveWrapper::findEndOfCentralDirectory(const std::vector<uint8_t>& archive,
                                               size_t& eocd_offset,
                                               std::string& error) {
    if (archive.size() < ZIP_END_OF_CENTRAL_SIZE) {
        error = "archive too small for an end-of-central-directory record (" +
                std::to_string(archive.size()) + " bytes)";
        return false;
    }

    // Comment plus at most one block of cipher padding may follow the record
    size_t max_back = ZIP_END_OF_CENTRAL_SIZE + ZIP_MAX_COMMENT_SIZE + CIPHER_BLOCK_SIZE;
    size_t lowest = archive.size() > max_back ? archive.size() - max_back : 0;

    for (size_t pos = archive.size() - ZIP_END_OF_CENTRAL_SIZE + 1; pos-- > lowest; ) {
        const uint8_t* p = archive.data() + pos;
        if (getU32(p) != ZIP_END_OF_CENTRAL_SIG) {
            continue;
        }

        uint16_t comment_len = getU16(p + 20);
        uint32_t central_size = getU32(p + 12);
        uint32_t central_offset = getU32(p + 16);

        if (pos + ZIP_END_OF_CENTRAL_SIZE + comment_len > archive.size()) {
            continue;
        }
        if (static_cast<uint64_t>(central_offset) + central_size > pos) {
            continue;
        }

        eocd_offset = pos;
        return true;
    }

    error = "end-of-central-directory record not found";
    return false;
}

bool ArchiveWrapper::listEntries(const std::vector<uint8_t>& archive,
                                 std::vector<ArchiveEntryInfo>& entries,
                                 std::string& error) {
    size_t eocd = 0;
    if (!findEndOfCentralDirectory(archive, eocd, error)) {
        return false;
    }

    const uint8_t* end_record = archive.data() + eocd;
    uint16_t disk = getU16(end_record + 4);
    uint16_t central_disk = getU16(end_record + 6);
    uint16_t entry_count = getU16(end_record + 10);
    uint32_t central_offset = getU32(end_record + 16);

    if (disk != 0 || central_disk != 0) {
        error = "multi-disk archives are not supported";
        return false;
    }

    std::vector<ArchiveEntryInfo> result;
    size_t pos = central_offset;

    for (uint16_t i = 0; i < entry_count; i++) {
        if (pos + ZIP_CENTRAL_HEADER_SIZE > eocd) {
            error = "central directory entry " + std::to_string(i) + " truncated";
            return false;
        }

        const uint8_t* p = archive.data() + pos;
        if (getU32(p) != ZIP_CENTRAL_HEADER_SIG) {
            error = "bad central directory signature at offset " + std::to_string(pos);
            return false;
        }

        uint16_t name_len = getU16(p + 28);
        uint16_t extra_len = getU16(p + 30);
        uint16_t comment_len = getU16(p + 32);
        size_t record_size = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;

        if (pos + record_size > eocd) {
            error = "central directory entry " + std::to_string(i) + " overruns directory";
            return false;
        }

        ArchiveEntryInfo entry;
        entry.flags = getU16(p + 8);
        entry.method = getU16(p + 10);
        entry.crc32 = getU32(p + 16);
        entry.compressed_size = getU32(p + 20);
        entry.uncompressed_size = getU32(p + 24);
        entry.local_header_offset = getU32(p + 42);
        entry.name.assign(reinterpret_cast<const char*>(p + ZIP_CENTRAL_HEADER_SIZE), name_len);

        if (entry.compressed_size == 0xFFFFFFFF || entry.uncompressed_size == 0xFFFFFFFF ||
            entry.local_header_offset == 0xFFFFFFFF) {
            error = "entry " + entry.name + " uses zip64 (unsupported)";
            return false;
        }

        result.push_back(entry);
        pos += record_size;
    }

    entries.swap(result);
    return true;
}

bool ArchiveWrapper::hasEntry(const std::vector<uint8_t>& archive, const std::string& name) {
    std::vector<ArchiveEntryInfo> entries;
    std::string error;
    if (!listEntries(archive, entries, error)) {
        return false;
    }
    for (const auto& entry : entries) {
        if (entry.name == name) {
            return true;
        }
    }
    return false;
}

bool ArchiveWrapper::extractEntry(const std::vector<uint8_t>& archive,
                                  const std::string& name,
                                  std::vector<uint8_t>& content,
                                  std::string& error) {
    std::vector<ArchiveEntryInfo> entries;
    if (!listEntries(archive, entries, error)) {
        return false;
    }

    const ArchiveEntryInfo* entry = nullptr;
    for (const auto& e : entries) {
        if (e.name == name) {
            entry = &e;
            break;
        }
    }
    if (entry == nullptr) {
        error = "entry not found: " + name;
        return false;
    }
    if (entry->flags & ZIP_FLAG_ENCRYPTED) {
        error = "entry " + name + " is encrypted (unsupported)";
        return false;
    }

    size_t pos = entry->local_header_offset;
    if (pos + ZIP_LOCAL_HEADER_SIZE > archive.size()) {
        error = "local header of " + name + " out of range";
        return false;
    }
    const uint8_t* p = archive.data() + pos;
    if (getU32(p) != ZIP_LOCAL_HEADER_SIG) {
        error = "bad local header signature for " + name;
        return false;
    }

    size_t data_offset = pos + ZIP_LOCAL_HEADER_SIZE + getU16(p + 26) + getU16(p + 28);
    if (data_offset + entry->compressed_size > archive.size()) {
        error = "data of " + name + " extends beyond archive";
        return false;
    }
    const uint8_t* data = archive.data() + data_offset;

    std::vector<uint8_t> result;
    if (entry->method == static_cast<uint16_t>(CompressionMethod::STORE)) {
        if (entry->compressed_size != entry->uncompressed_size) {
            error = "stored entry " + name + " has mismatching sizes";
            return false;
        }
        result.assign(data, data + entry->compressed_size);
    } else if (entry->method == static_cast<uint16_t>(CompressionMethod::DEFLATE)) {
        if (!inflateRaw(data, entry->compressed_size, entry->uncompressed_size, result, error)) {
            error = name + ": " + error;
            return false;
        }
    } else {
        error = "entry " + name + " uses unsupported method " + std::to_string(entry->method);
        return false;
    }

    uint32_t crc = static_cast<uint32_t>(crc32(0L, result.data(), static_cast<uInt>(result.size())));
    if (crc != entry->crc32) {
        error = "CRC-32 mismatch for " + name + ": stored=" + std::to_string(entry->crc32) +
                " calculated=" + std::to_string(crc);
        return false;
    }

    content.swap(result);
    return true;
}

bool ArchiveWrapper::archiveLength(const std::vector<uint8_t>& archive,
                                   size_t& length,
                                   std::string& error) {
    size_t eocd = 0;
    if (!findEndOfCentralDirectory(archive, eocd, error)) {
        return false;
    }
    uint16_t comment_len = getU16(archive.data() + eocd + 20);
    length = eocd + ZIP_END_OF_CENTRAL_SIZE + comment_len;
    return true;
}

void ArchiveWrapper::printSummary(const std::vector<ArchiveEntryInfo>& entries) {
    std::cout << "[ARCHIVE] Entries: " << entries.size() << "\n";
    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        std::cout << "[ARCHIVE]   [" << (i + 1) << "] " << entry.name
                  << " (" << entry.uncompressed_size << " bytes, "
                  << (entry.method == static_cast<uint16_t>(CompressionMethod::DEFLATE) ? "deflate" :
                      entry.method == static_cast<uint16_t>(CompressionMethod::STORE) ? "store" : "other")
                  << ", " << entry.compressed_size << " stored)\n";
    }
}
