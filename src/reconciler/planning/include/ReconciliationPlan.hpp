// src/reconciler/planning/include/ReconciliationPlan.hpp
#pragma once
#include "common/types/SecretTypes.hpp"
#include <string>
#include <vector>

namespace secret_reconciler::reconciler
{
    enum class OperationKind
    {
        CREATE = 0,
        UPDATE_LABELS,
        ADD_VERSION,
        RETIRE_VERSION,
        GRANT_ACCESS,
        REVOKE_ACCESS
    };

    enum class RetireMode
    {
        DISABLE = 0,
        DESTROY
    };

    const char* ToString(OperationKind kind);
    const char* ToString(RetireMode mode);

    /**
     * @brief 계획된 원격 변경 1건
     *
     * kind 에 따라 사용하는 필드가 다르다:
     * - CREATE, UPDATE_LABELS: labels
     * - RETIRE_VERSION: retire_mode (대상 버전은 실행 시점에 새 버전 - 1 로 결정)
     * - GRANT_ACCESS, REVOKE_ACCESS: principal
     */
    struct PlannedOperation
    {
        OperationKind kind = OperationKind::ADD_VERSION;
        LabelList labels;
        RetireMode retire_mode = RetireMode::DESTROY;
        std::string principal;

        static PlannedOperation Create(const LabelList& labels);
        static PlannedOperation UpdateLabels(const LabelList& labels);
        static PlannedOperation AddVersion();
        static PlannedOperation RetireVersion(RetireMode mode);
        static PlannedOperation Grant(const std::string& principal);
        static PlannedOperation Revoke(const std::string& principal);

        // 로그용 한 줄 요약 (예: "grant serviceAccount:a@p.iam.gserviceaccount.com")
        std::string Describe() const;
    };

    /**
     * @brief 시크릿 1개에 대한 실행 순서가 고정된 변경 목록
     *
     * 순서: [CREATE] 또는 [UPDATE_LABELS?, ADD_VERSION, RETIRE_VERSION?], 이후 REVOKE*, GRANT*
     */
    struct ReconciliationPlan
    {
        std::string secret_name;
        std::vector<PlannedOperation> operations;
        std::vector<std::string> warnings;   // 계획 단계에서 건너뛴 항목 (예: 알 수 없는 onUpdateBehavior)

        bool Contains(OperationKind kind) const;
        size_t Count(OperationKind kind) const;
        std::vector<OperationKind> Kinds() const;
    };
}
