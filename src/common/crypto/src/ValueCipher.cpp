// src/common/crypto/src/ValueCipher.cpp
#include "common/crypto/include/ValueCipher.hpp"
#include "common/crypto/include/CryptoException.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

namespace secret_reconciler::crypto
{
    namespace
    {
        struct CipherCtxDeleter
        {
            void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
        };
        using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

        CipherCtxPtr NewContext()
        {
            CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
            if (!ctx) {
                throw CipherException("EVP_CIPHER_CTX_new failed");
            }
            return ctx;
        }
    }

    ValueCipher::ValueCipher(const std::string& passphrase)
    {
        if (passphrase.empty()) {
            throw CipherException("encryption passphrase is empty");
        }

        unsigned int digest_len = 0;
        if (EVP_Digest(passphrase.data(), passphrase.size(), key.data(), &digest_len,
                       EVP_sha256(), nullptr) != 1 || digest_len != KEY_SIZE) {
            throw CipherException("SHA-256 key derivation failed");
        }
    }

    std::string ValueCipher::Encrypt(const std::string& plaintext) const
    {
        std::array<uint8_t, IV_SIZE> iv{};
        if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
            throw CipherException("RAND_bytes failed");
        }

        CipherCtxPtr ctx = NewContext();

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            throw CipherException("EVP_EncryptInit_ex failed");
        }

        std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
        int out_len = 0;
        int total_len = 0;

        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len,
                              reinterpret_cast<const uint8_t*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw CipherException("EVP_EncryptUpdate failed");
        }
        total_len = out_len;

        if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &out_len) != 1) {
            throw CipherException("EVP_EncryptFinal_ex failed");
        }
        total_len += out_len;

        std::array<uint8_t, TAG_SIZE> tag{};
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
            throw CipherException("failed to read GCM tag");
        }

        return ToHex(iv.data(), iv.size()) + ":" +
               ToHex(ciphertext.data(), static_cast<size_t>(total_len)) + ":" +
               ToHex(tag.data(), tag.size());
    }

    std::string ValueCipher::Decrypt(const std::string& token) const
    {
        size_t first = token.find(':');
        size_t second = (first == std::string::npos) ? std::string::npos : token.find(':', first + 1);
        if (first == std::string::npos || second == std::string::npos ||
            token.find(':', second + 1) != std::string::npos) {
            throw DecryptionException("value is not an encrypted token");
        }

        std::vector<uint8_t> iv;
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> tag;
        if (!FromHex(token.substr(0, first), iv) ||
            !FromHex(token.substr(first + 1, second - first - 1), ciphertext) ||
            !FromHex(token.substr(second + 1), tag)) {
            throw DecryptionException("token is not valid hex");
        }
        if (iv.size() != IV_SIZE || tag.size() != TAG_SIZE) {
            throw DecryptionException("token has wrong IV or tag length");
        }

        CipherCtxPtr ctx = NewContext();

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            throw CipherException("EVP_DecryptInit_ex failed");
        }

        std::vector<uint8_t> plaintext(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
        int out_len = 0;
        int total_len = 0;

        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            throw DecryptionException("EVP_DecryptUpdate failed");
        }
        total_len = out_len;

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
            throw CipherException("failed to set GCM tag");
        }

        // 태그 불일치 = 키가 틀렸거나 암호문이 손상됨
        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) <= 0) {
            throw DecryptionException("authentication failed (wrong key or corrupted ciphertext)");
        }
        total_len += out_len;

        return std::string(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total_len));
    }

    std::string ValueCipher::ToHex(const uint8_t* data, size_t size)
    {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string result;
        result.reserve(size * 2);
        for (size_t i = 0; i < size; ++i) {
            result.push_back(kHex[(data[i] >> 4) & 0x0F]);
            result.push_back(kHex[data[i] & 0x0F]);
        }
        return result;
    }

    bool ValueCipher::FromHex(const std::string& hex, std::vector<uint8_t>& out)
    {
        if (hex.size() % 2 != 0) {
            return false;
        }

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        out.clear();
        out.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return true;
    }
}
