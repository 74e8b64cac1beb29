/**
 * @file aes_cbc_cipher.cpp
 * @brief AES-256-CBC (no padding) using the OpenSSL EVP API
 */

#include "cipher_provider.hpp"
#include <climits>
#include <openssl/evp.h>
#include <openssl/err.h>

// Drain the OpenSSL error queue into a single diagnostic string
static std::string collectOpenSslErrors(const std::string& step) {
    std::string message = step;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    return message;
}

bool AesCbcCipher::encrypt(const CipherKey& key,
                           const std::vector<uint8_t>& plaintext,
                           std::vector<uint8_t>& ciphertext,
                           std::string& error) const {
    return transform(true, key, plaintext, ciphertext, error);
}

bool AesCbcCipher::decrypt(const CipherKey& key,
                           const std::vector<uint8_t>& ciphertext,
                           std::vector<uint8_t>& plaintext,
                           std::string& error) const {
    return transform(false, key, ciphertext, plaintext, error);
}

bool AesCbcCipher::transform(bool do_encrypt,
                             const CipherKey& key,
                             const std::vector<uint8_t>& input,
                             std::vector<uint8_t>& output,
                             std::string& error) const {
    if (input.size() % blockSize() != 0) {
        error = "input length " + std::to_string(input.size()) +
                " is not a multiple of " + std::to_string(blockSize());
        return false;
    }
    if (input.size() > static_cast<size_t>(INT_MAX)) {
        error = "input too large for a single EVP update";
        return false;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (ctx == nullptr) {
        error = collectOpenSslErrors("EVP_CIPHER_CTX_new failed");
        return false;
    }

    // One spare block so the final call always has a valid output pointer
    std::vector<uint8_t> result(input.size() + blockSize());
    int len = 0;
    int flen = 0;
    bool ok = false;

    do {
        if (EVP_CipherInit_ex(ctx, EVP_aes_256_cbc(), nullptr,
                              key.key, key.iv, do_encrypt ? 1 : 0) != 1) {
            error = collectOpenSslErrors("AES-256-CBC init failed");
            break;
        }
        // Caller guarantees block alignment
        if (EVP_CIPHER_CTX_set_padding(ctx, 0) != 1) {
            error = collectOpenSslErrors("AES-256-CBC set_padding failed");
            break;
        }
        if (!input.empty() &&
            EVP_CipherUpdate(ctx, result.data(), &len, input.data(), (int)input.size()) != 1) {
            error = collectOpenSslErrors("AES-256-CBC update failed");
            break;
        }
        if (EVP_CipherFinal_ex(ctx, result.data() + len, &flen) != 1) {
            error = collectOpenSslErrors("AES-256-CBC final failed");
            break;
        }
        if ((size_t)(len + flen) != input.size()) {
            error = "AES-256-CBC produced " + std::to_string(len + flen) +
                    " bytes for " + std::to_string(input.size()) + " input bytes";
            break;
        }
        ok = true;
    } while (0);

    EVP_CIPHER_CTX_free(ctx);

    if (ok) {
        result.resize(input.size());
        output.swap(result);
    }
    return ok;
}
