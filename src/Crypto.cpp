#include "Crypto.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <cstring>

namespace
{
    std::string opensslError(const std::string &what)
    {
        unsigned long code = ERR_get_error();
        if (code == 0)
        {
            return what;
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        return what + ": " + buffer;
    }
}

Crypto::Crypto()
    : m_ctx(EVP_CIPHER_CTX_new())
{
    if (!m_ctx)
    {
        throw std::runtime_error("Failed to create cipher context");
    }
}

Crypto::~Crypto()
{
    EVP_CIPHER_CTX_free(m_ctx);
}

std::vector<uint8_t> Crypto::generateKey()
{
    std::vector<uint8_t> key(KEY_SIZE);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed to generate key"));
    }
    return key;
}

std::vector<uint8_t> Crypto::encrypt(const std::vector<uint8_t> &plaintext,
                                     const std::vector<uint8_t> &key)
{
    if (key.size() != KEY_SIZE)
    {
        throw std::runtime_error("Invalid key size");
    }

    std::vector<uint8_t> result(GCM_IV_SIZE + plaintext.size() + GCM_TAG_SIZE);
    uint8_t *iv = result.data();
    uint8_t *ciphertext = result.data() + GCM_IV_SIZE;

    if (RAND_bytes(iv, static_cast<int>(GCM_IV_SIZE)) != 1)
    {
        throw std::runtime_error(opensslError("Failed to generate IV"));
    }

    EVP_CIPHER_CTX_reset(m_ctx);
    if (EVP_EncryptInit_ex(m_ctx, EVP_aes_256_gcm(), nullptr, key.data(), iv) != 1)
    {
        throw std::runtime_error(opensslError("Failed to initialize encryption"));
    }

    int encryptedLen = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(m_ctx, ciphertext, &encryptedLen,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed during encryption update"));
    }

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(m_ctx, ciphertext + encryptedLen, &finalLen) != 1)
    {
        throw std::runtime_error(opensslError("Failed to finalize encryption"));
    }

    // GCM does not pad
    if (static_cast<size_t>(encryptedLen + finalLen) != plaintext.size())
    {
        throw std::runtime_error("Unexpected encryption output size");
    }

    if (EVP_CIPHER_CTX_ctrl(m_ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            ciphertext + plaintext.size()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to get authentication tag"));
    }

    return result;
}

std::vector<uint8_t> Crypto::decrypt(const std::vector<uint8_t> &sealed,
                                     const std::vector<uint8_t> &key)
{
    if (key.size() != KEY_SIZE)
    {
        throw std::runtime_error("Invalid key size");
    }
    if (sealed.size() < GCM_IV_SIZE + GCM_TAG_SIZE)
    {
        throw std::runtime_error("Encrypted data too small - missing IV or tag");
    }

    const uint8_t *iv = sealed.data();
    const uint8_t *ciphertext = sealed.data() + GCM_IV_SIZE;
    const size_t ciphertextSize = sealed.size() - GCM_IV_SIZE - GCM_TAG_SIZE;
    std::vector<uint8_t> tag(sealed.end() - GCM_TAG_SIZE, sealed.end());

    EVP_CIPHER_CTX_reset(m_ctx);
    if (EVP_DecryptInit_ex(m_ctx, EVP_aes_256_gcm(), nullptr, key.data(), iv) != 1)
    {
        throw std::runtime_error(opensslError("Failed to initialize decryption"));
    }

    std::vector<uint8_t> plaintext(ciphertextSize);
    int decryptedLen = 0;
    if (ciphertextSize > 0 &&
        EVP_DecryptUpdate(m_ctx, plaintext.data(), &decryptedLen,
                          ciphertext, static_cast<int>(ciphertextSize)) != 1)
    {
        throw std::runtime_error(opensslError("Failed during decryption update"));
    }

    if (EVP_CIPHER_CTX_ctrl(m_ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to set authentication tag"));
    }

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(m_ctx, plaintext.data() + decryptedLen, &finalLen) != 1)
    {
        throw std::runtime_error("Authentication failed: data may have been tampered with");
    }

    plaintext.resize(decryptedLen + finalLen);
    return plaintext;
}
