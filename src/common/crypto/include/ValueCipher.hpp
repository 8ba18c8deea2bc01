// src/common/crypto/include/ValueCipher.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace secret_reconciler::crypto
{
    /**
     * @brief 값 단위 AES-256-GCM 암복호화 (OpenSSL EVP)
     *
     * 키 = SHA-256(passphrase).
     * 토큰 형식: "<iv hex>:<ciphertext hex>:<tag hex>" (IV 12바이트, 태그 16바이트).
     * 암호화할 때마다 새 IV 를 사용하므로 같은 값도 매번 다른 토큰이 된다.
     */
    class ValueCipher
    {
    public:
        static constexpr size_t KEY_SIZE = 32;
        static constexpr size_t IV_SIZE = 12;
        static constexpr size_t TAG_SIZE = 16;

        explicit ValueCipher(const std::string& passphrase);

        std::string Encrypt(const std::string& plaintext) const;

        /**
         * @throws DecryptionException 형식 오류 또는 인증 태그 불일치
         */
        std::string Decrypt(const std::string& token) const;

    private:
        std::array<uint8_t, KEY_SIZE> key;

        static std::string ToHex(const uint8_t* data, size_t size);
        static bool FromHex(const std::string& hex, std::vector<uint8_t>& out);
    };
}
