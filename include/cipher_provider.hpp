/**
 * @file cipher_provider.hpp
 * @brief Block cipher capability used by the container codec
 *
 * Providers operate on block-aligned data only and apply no padding of
 * their own; the codec pads with zeros before encrypting.
 */

#ifndef CIPHER_PROVIDER_HPP
#define CIPHER_PROVIDER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// ==================== Constants ====================

#define CIPHER_KEY_SIZE     32      // AES-256
#define CIPHER_IV_SIZE      16

/**
 * @brief Key material passed explicitly on every call
 */
struct CipherKey {
    uint8_t key[CIPHER_KEY_SIZE];
    uint8_t iv[CIPHER_IV_SIZE];
};

/**
 * @brief Cipher Provider Interface
 */
class CipherProvider {
public:
    virtual ~CipherProvider() = default;

    /**
     * @brief Cipher block size in bytes
     */
    virtual size_t blockSize() const = 0;

    /**
     * @brief Provider name (diagnostics)
     */
    virtual std::string name() const = 0;

    /**
     * @brief Encrypt block-aligned plaintext
     * @param key Key material
     * @param plaintext Input (length multiple of blockSize())
     * @param ciphertext Output, same length as input
     * @param error Provider diagnostic text on failure
     * @return true if successful
     */
    virtual bool encrypt(const CipherKey& key,
                         const std::vector<uint8_t>& plaintext,
                         std::vector<uint8_t>& ciphertext,
                         std::string& error) const = 0;

    /**
     * @brief Decrypt block-aligned ciphertext
     */
    virtual bool decrypt(const CipherKey& key,
                         const std::vector<uint8_t>& ciphertext,
                         std::vector<uint8_t>& plaintext,
                         std::string& error) const = 0;
};

/**
 * @brief AES-256-CBC without padding (OpenSSL EVP)
 */
class AesCbcCipher : public CipherProvider {
public:
    size_t blockSize() const override { return 16; }
    std::string name() const override { return "AES-256-CBC"; }

    bool encrypt(const CipherKey& key,
                 const std::vector<uint8_t>& plaintext,
                 std::vector<uint8_t>& ciphertext,
                 std::string& error) const override;

    bool decrypt(const CipherKey& key,
                 const std::vector<uint8_t>& ciphertext,
                 std::vector<uint8_t>& plaintext,
                 std::string& error) const override;

private:
    bool transform(bool do_encrypt,
                   const CipherKey& key,
                   const std::vector<uint8_t>& input,
                   std::vector<uint8_t>& output,
                   std::string& error) const;
};

#endif // CIPHER_PROVIDER_HPP
