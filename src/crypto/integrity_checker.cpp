/**
 * @file integrity_checker.cpp
 * @brief MD5 via OpenSSL EVP
 */

#include "integrity_checker.hpp"
#include <iostream>
#include <cstring>
#include <openssl/evp.h>

bool IntegrityChecker::digest(const uint8_t* data, size_t size, uint8_t digest[OTA_DIGEST_SIZE]) {
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        std::cerr << "[INTEGRITY] ✗ EVP_MD_CTX_new failed\n";
        return false;
    }

    if (EVP_DigestInit_ex(mdctx, EVP_md5(), nullptr) != 1) {
        std::cerr << "[INTEGRITY] ✗ MD5 init failed\n";
        EVP_MD_CTX_free(mdctx);
        return false;
    }

    if (size > 0 && EVP_DigestUpdate(mdctx, data, size) != 1) {
        std::cerr << "[INTEGRITY] ✗ MD5 update failed\n";
        EVP_MD_CTX_free(mdctx);
        return false;
    }

    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(mdctx, digest, &digest_len) != 1 || digest_len != OTA_DIGEST_SIZE) {
        std::cerr << "[INTEGRITY] ✗ MD5 final failed\n";
        EVP_MD_CTX_free(mdctx);
        return false;
    }

    EVP_MD_CTX_free(mdctx);
    return true;
}

DigestCheck IntegrityChecker::verify(const uint8_t* data, size_t size,
                                     const uint8_t expected[OTA_DIGEST_SIZE],
                                     uint8_t calculated[OTA_DIGEST_SIZE]) {
    if (!digest(data, size, calculated)) {
        return DigestCheck::FAILED;
    }
    if (std::memcmp(calculated, expected, OTA_DIGEST_SIZE) != 0) {
        return DigestCheck::MISMATCH;
    }
    return DigestCheck::MATCH;
}
