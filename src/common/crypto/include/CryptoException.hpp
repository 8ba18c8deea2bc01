// src/common/crypto/include/CryptoException.hpp
#pragma once
#include "common/types/SecretsException.hpp"

namespace secret_reconciler::crypto
{
    /**
     * @brief 복호화 실패 (잘못된 키, 손상된 암호문, 형식 오류)
     *
     * 파일은 원래의 암호화 상태 그대로 남는다.
     */
    class DecryptionException : public SecretsException
    {
    public:
        explicit DecryptionException(const std::string& msg)
            : SecretsException("Decryption failed: " + msg) {}
    };

    /**
     * @brief OpenSSL 내부 오류 (컨텍스트 생성, 난수 생성 등)
     */
    class CipherException : public SecretsException
    {
    public:
        explicit CipherException(const std::string& msg)
            : SecretsException("Cipher error: " + msg) {}
    };
}
