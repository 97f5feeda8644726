#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <openssl/evp.h>

/**
 * @brief AES-256-GCM sealing of shipped batches
 *
 * Sealed layout: [12 bytes IV][ciphertext][16 bytes tag]. A fresh random IV
 * is drawn for every call to encrypt().
 */
class Crypto
{
public:
    static constexpr size_t KEY_SIZE = 32;     // 256 bits
    static constexpr size_t GCM_IV_SIZE = 12;  // 96 bits (recommended for GCM)
    static constexpr size_t GCM_TAG_SIZE = 16; // 128 bits

    Crypto();
    ~Crypto();

    Crypto(const Crypto &) = delete;
    Crypto &operator=(const Crypto &) = delete;

    std::vector<uint8_t> encrypt(const std::vector<uint8_t> &plaintext,
                                 const std::vector<uint8_t> &key);

    // Throws std::runtime_error if the data is malformed or fails authentication
    std::vector<uint8_t> decrypt(const std::vector<uint8_t> &sealed,
                                 const std::vector<uint8_t> &key);

    static std::vector<uint8_t> generateKey();

private:
    EVP_CIPHER_CTX *m_ctx;
};

#endif
