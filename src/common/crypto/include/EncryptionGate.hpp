// src/common/crypto/include/EncryptionGate.hpp
#pragma once
#include "common/crypto/include/ValueCipher.hpp"
#include "common/types/SecretTypes.hpp"
#include <memory>
#include <string>

namespace secret_reconciler::env
{
    class EnvConfig;
}

namespace secret_reconciler::crypto
{
    /**
     * @brief 암호화 게이트
     *
     * - 키가 설정되어 있지 않으면 deploy 전체가 no-op (성공) 으로 끝난다
     * - 메모리 상의 정의만 변환하고, 디스크 쓰기는 SecretFileStore 가 담당한다
     */
    class EncryptionGate
    {
    private:
        std::unique_ptr<ValueCipher> cipher;

    public:
        /**
         * @param passphrase 암호화 키 (빈 문자열이면 미설정)
         */
        explicit EncryptionGate(const std::string& passphrase);

        /**
         * @brief 설정(프로세스 환경 변수 → env 파일)에서 GCP_SECRETS_ENCRYPTION_KEY 조회
         */
        static EncryptionGate FromConfig(const env::EnvConfig& config);

        bool IsEncryptionConfigured() const { return cipher != nullptr; }

        /**
         * @brief payload 의 모든 값을 복호화한 사본 반환 (status = plaintext)
         *
         * 이미 평문인 정의는 그대로 복사해서 반환한다.
         *
         * @throws DecryptionException 키 불일치, 손상된 값, 토큰이 아닌 값
         * @throws ConfigurationException 키가 설정되지 않았는데 암호화된 정의를 받은 경우
         */
        SecretDefinition Decrypt(const SecretDefinition& definition) const;

        /**
         * @brief payload 의 모든 값을 암호화한 사본 반환 (status = encrypted)
         *
         * 이미 암호화된 정의는 그대로 복사해서 반환한다.
         */
        SecretDefinition Encrypt(const SecretDefinition& definition) const;

    private:
        const ValueCipher& RequireCipher() const;
    };
}
