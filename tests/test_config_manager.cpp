#include "config_manager.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <string>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

int main() {
    bool ok = true;
    const std::string path = "test_config_manager.json";

    // ---- Built-in defaults ----
    {
        ConfigManager config;
        ok &= check(config.load(), "load without a file failed");
        ok &= check(!config.isLoaded(), "defaults reported as a loaded file");

        CipherKey enc, dec;
        ok &= check(config.getCipherKey(KeyRole::ENCODE, enc), "default encode key");
        ok &= check(config.getCipherKey(KeyRole::DECODE, dec), "default decode key");
        ok &= check(enc.key[0] == 0x78 && enc.key[29] == 0x0B && enc.key[30] == 0x1F &&
                    enc.key[31] == 0xCE, "encode key bytes");
        ok &= check(dec.key[0] == 0x78 && dec.key[29] == 0x0B && dec.key[30] == 0x09 &&
                    dec.key[31] == 0x28, "decode key bytes");
        ok &= check(enc.iv[0] == 0x54 && enc.iv[15] == 0x49, "iv bytes");

        ok &= check(config.getEntryName() == "update/update.swu", "default entry name");
        ok &= check(config.getCompressionMethod() == CompressionMethod::DEFLATE,
                    "default compression");
        FirmwareVersion v = config.getDefaultVersion();
        ok &= check(v.major == 0 && v.minor == 0 && v.patch == 0 && v.board_type == 0,
                    "default version");
        ok &= check(!config.trimPadding(), "default trim");
        ok &= check(!config.isVerbose(), "default verbosity");
    }

    // ---- Overrides ----
    {
        writeText(path,
            "{\n"
            "  \"cipher\": {\n"
            "    \"decode_key\": \"78B6A614B6B6E361DC84D705B7FDDA33C967DDF2970A689F8156F78EFE0B1FCE\"\n"
            "  },\n"
            "  \"archive\": { \"entry_name\": \"fw/image.swu\", \"compression\": \"store\" },\n"
            "  \"firmware\": { \"major\": 2, \"minor\": 5, \"patch\": 9, \"board_type\": 1 },\n"
            "  \"decode\": { \"trim_padding\": true },\n"
            "  \"logging\": { \"verbose\": true }\n"
            "}\n");

        ConfigManager config(path);
        ok &= check(config.load(), "load of override file failed");
        ok &= check(config.isLoaded(), "file not reported as loaded");

        CipherKey enc, dec;
        config.getCipherKey(KeyRole::ENCODE, enc);
        config.getCipherKey(KeyRole::DECODE, dec);
        ok &= check(dec.key[31] == 0xCE && enc.key[31] == 0xCE, "decode key override");
        ok &= check(config.getEntryName() == "fw/image.swu", "entry name override");
        ok &= check(config.getCompressionMethod() == CompressionMethod::STORE,
                    "compression override");
        FirmwareVersion v = config.getDefaultVersion();
        ok &= check(v.major == 2 && v.minor == 5 && v.patch == 9 && v.board_type == 1,
                    "version override");
        ok &= check(config.trimPadding(), "trim override");
        ok &= check(config.isVerbose(), "verbose override");
        ok &= check(config.getRawConfig().contains("firmware"), "raw config");
    }

    // ---- Rejected files ----
    {
        writeText(path, "{ \"cipher\": { \"encode_key\": \"ABCD\" } }");
        ConfigManager short_key(path);
        ok &= check(!short_key.load(), "short key accepted");

        writeText(path, "{ \"cipher\": { \"iv\": \"ZZE37626B9A699403064111F77858049\" } }");
        ConfigManager bad_iv(path);
        ok &= check(!bad_iv.load(), "non-hex IV accepted");
        CipherKey fallback;
        ok &= check(bad_iv.getCipherKey(KeyRole::ENCODE, fallback),
                    "failed load did not restore defaults");

        writeText(path, "{ \"archive\": { \"compression\": \"lzma\" } }");
        ConfigManager bad_method(path);
        ok &= check(!bad_method.load(), "unknown compression accepted");

        writeText(path, "{ \"firmware\": { \"major\": \"one\" } }");
        ConfigManager bad_type(path);
        ok &= check(!bad_type.load(), "string version accepted");

        writeText(path, "{ not json");
        ConfigManager malformed(path);
        ok &= check(!malformed.load(), "malformed JSON accepted");

        writeText(path, "[1, 2, 3]");
        ConfigManager array(path);
        ok &= check(!array.load(), "non-object JSON accepted");

        ConfigManager missing("does_not_exist.json");
        ok &= check(!missing.load(), "missing file accepted");
    }

    std::remove(path.c_str());

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
