// src/reconciler/RunCoordinator.hpp
#pragma once
#include "common/crypto/include/EncryptionGate.hpp"
#include "common/remote/include/ISecretService.hpp"
#include "common/remote/include/RemoteStateReader.hpp"
#include "common/storage/include/SecretFileStore.hpp"
#include "reconciler/mutation/include/RemoteMutator.hpp"
#include "reconciler/planning/include/ReconciliationPlanner.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace secret_reconciler::reconciler
{
    // 시크릿 1개의 처리 단계
    enum class SecretState
    {
        PENDING = 0,
        SKIPPED,
        DECRYPTING,
        RECONCILING,
        RE_ENCRYPTING,
        DONE
    };

    const char* ToString(SecretState state);

    struct RunOptions
    {
        std::filesystem::path source_root;
        std::string project;         // 빈 문자열 = gcloud 기본 프로젝트
        std::string secret_filter;   // 설정 시 이 이름의 시크릿만 처리, 나머지는 skipped
    };

    struct SecretOutcome
    {
        std::string name;
        std::filesystem::path file;
        SecretState state = SecretState::PENDING;
        SecretState failed_in = SecretState::PENDING;   // 실패가 발생한 단계
        bool success = false;
        std::string error;
        std::vector<std::string> warnings;
        std::vector<std::string> executed;

        bool IsSkipped() const { return state == SecretState::SKIPPED; }
    };

    /**
     * @brief 실행 결과 집계
     *
     * skipped 시크릿은 succeeded 에 포함된다. overall_success = (succeeded == total).
     */
    struct RunResult
    {
        size_t total = 0;
        size_t succeeded = 0;
        size_t skipped = 0;
        std::vector<std::string> failed;
        bool overall_success = true;

        bool short_circuited = false;   // 암호화 키 미설정으로 아무것도 하지 않음
        std::string error;              // 실행 전체 실패 사유 (목록 조회 실패 등)
        std::vector<SecretOutcome> outcomes;
    };

    /**
     * @brief deploy / encrypt / decrypt 실행 조율
     *
     * deploy 흐름:
     *   키 확인 → 정의 파일 목록 → 원격 목록 1회 (스냅샷) → 시크릿별 비동기 처리 → 집계
     *   같은 시크릿 이름을 가진 파일이 둘 이상이면 그 파일들은 원격 호출 없이 실패한다.
     *
     * 시크릿별 처리 (각자 독립된 예외 경계):
     *   읽기 → 계획 → 복호화/payload 스테이징 → 원격 반영 → 원래 형태 복원
     */
    class RunCoordinator
    {
    public:
        RunCoordinator(std::shared_ptr<remote::ISecretService> service,
                       crypto::EncryptionGate gate);

        RunResult Deploy(const RunOptions& options) const;

        // 정의 파일을 암호화 상태로 재기록 (키 필수)
        RunResult EncryptFiles(const RunOptions& options) const;

        // 정의 파일을 평문 상태로 재기록 (키 필수)
        RunResult DecryptFiles(const RunOptions& options) const;

    private:
        SecretOutcome ReconcileSecret(const std::filesystem::path& file,
                                      const remote::RemoteSnapshot& snapshot,
                                      const RemoteMutator& mutator,
                                      const std::string& project) const;

        RunResult TransformFiles(const RunOptions& options, EncryptionStatus target) const;

        static SecretOutcome SkippedOutcome(const std::string& name, const std::filesystem::path& file);
        static SecretOutcome DuplicateNameOutcome(const std::string& name,
                                                  const std::filesystem::path& file,
                                                  const std::vector<std::filesystem::path>& same_name);
        static void Aggregate(RunResult& result);
        static void LogSummary(const char* command, const RunResult& result);

        std::shared_ptr<remote::ISecretService> service;
        crypto::EncryptionGate gate;
        storage::SecretFileStore store;
        remote::RemoteStateReader reader;
        ReconciliationPlanner planner;
    };
}
