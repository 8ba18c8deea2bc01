// src/reconciler/guard/include/DecryptedDefinitionGuard.hpp
#pragma once
#include "common/crypto/include/EncryptionGate.hpp"
#include "common/storage/include/SecretFileStore.hpp"
#include "common/types/SecretTypes.hpp"
#include <filesystem>

namespace secret_reconciler::reconciler
{
    /**
     * @brief 정의 파일을 업로드용 평문 payload 로 잠시 바꿔 두는 RAII 가드
     *
     * 생성자:
     *   1) 메모리에서 복호화 (실패 시 DecryptionException, 파일은 건드리지 않음)
     *   2) 정의 파일 자리에 메타데이터를 뺀 평문 payload 를 원자적으로 기록
     *
     * Restore() 또는 소멸자:
     *   파일을 읽었던 원래 형태 (암호화 상태면 원래 암호문) 로 되돌린다.
     *   어떤 경로로 빠져나가도 평문 파일이 남지 않도록 소멸자에서 한 번 더 시도한다.
     */
    class DecryptedDefinitionGuard
    {
    public:
        DecryptedDefinitionGuard(const storage::SecretFileStore& store,
                                 const crypto::EncryptionGate& gate,
                                 const SecretDefinition& original);
        ~DecryptedDefinitionGuard();

        DecryptedDefinitionGuard(const DecryptedDefinitionGuard&) = delete;
        DecryptedDefinitionGuard& operator=(const DecryptedDefinitionGuard&) = delete;

        // 원격 서비스에 넘길 데이터 파일 (= 정의 파일 경로)
        const std::filesystem::path& DataFile() const { return original.file_path; }

        const SecretDefinition& Plaintext() const { return plaintext; }

        /**
         * @brief 원래 형태로 되돌리기
         * @return 기록 성공 여부 (이미 복원된 경우 true)
         */
        bool Restore();

        bool IsStaged() const { return staged; }

    private:
        const storage::SecretFileStore& store;
        SecretDefinition original;
        SecretDefinition plaintext;
        bool staged = false;
    };
}
