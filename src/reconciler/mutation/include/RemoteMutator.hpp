// src/reconciler/mutation/include/RemoteMutator.hpp
#pragma once
#include "common/remote/include/ISecretService.hpp"
#include "reconciler/planning/include/ReconciliationPlan.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace secret_reconciler::reconciler
{
    struct MutationReport
    {
        bool success = true;
        std::string error;                    // 실패 사유 (success == false 일 때)
        std::string new_version;              // ADD_VERSION 결과
        std::vector<std::string> executed;    // 성공한 작업 요약
        std::vector<std::string> warnings;    // best-effort 실패 / 건너뛴 작업
    };

    /**
     * @brief 계획을 순서대로 원격 서비스에 적용
     *
     * - CREATE / ADD_VERSION 실패: 시크릿 실패, 남은 작업 중단
     * - UPDATE_LABELS / RETIRE_VERSION / GRANT / REVOKE 실패: 경고만
     *
     * 재시도하지 않는다. 예외는 이 경계 밖으로 나가지 않고 MutationReport 로 변환된다.
     */
    class RemoteMutator
    {
    public:
        RemoteMutator(std::shared_ptr<remote::ISecretService> service, std::string project);

        /**
         * @param data_file 업로드할 payload 문서 (CREATE / ADD_VERSION 에서 사용)
         */
        MutationReport Execute(const ReconciliationPlan& plan, const std::filesystem::path& data_file) const;

        const std::string& GetProject() const { return project; }

    private:
        void ExecuteOne(const std::string& secret,
                        const PlannedOperation& op,
                        const std::filesystem::path& data_file,
                        MutationReport& report) const;

        void RetirePreviousVersion(const std::string& secret,
                                   RetireMode mode,
                                   MutationReport& report) const;

        std::shared_ptr<remote::ISecretService> service;
        std::string project;
    };
}
