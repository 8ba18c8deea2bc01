// src/reconciler/planning/include/ReconciliationPlanner.hpp
#pragma once
#include "reconciler/planning/include/ReconciliationPlan.hpp"
#include <optional>

namespace secret_reconciler::reconciler
{
    /**
     * @brief 선언 상태와 원격 스냅샷 비교 → 변경 계획
     *
     * 원격 호출 없음 (순수 함수). 접근 바인딩은 호출자가 미리 조회해서 넘긴다.
     */
    class ReconciliationPlanner
    {
    public:
        /**
         * @param definition 로컬 정의 (payload 암호화 여부 무관)
         * @param remote 스냅샷에서 찾은 원격 시크릿, 없으면 nullptr
         * @param current_bindings 현재 접근 바인딩.
         *        serviceAccounts 가 선언된 기존 시크릿인데 nullopt 이면 바인딩 변경을 건너뛴다 (조회 실패).
         *        원격에 없는 시크릿은 값과 관계없이 빈 집합으로 취급.
         */
        ReconciliationPlan Plan(const SecretDefinition& definition,
                                const RemoteSecret* remote,
                                const std::optional<PrincipalSet>& current_bindings) const;

        /**
         * @brief 라벨 비교 ("key=value" 집합, 순서 무관)
         */
        static bool LabelsDiffer(const LabelList& declared, const std::map<std::string, std::string>& remote);

    private:
        void PlanExisting(const SecretDefinition& definition,
                          const RemoteSecret& remote,
                          ReconciliationPlan& plan) const;

        void PlanAccessBindings(const PrincipalSet& declared,
                                const PrincipalSet& current,
                                ReconciliationPlan& plan) const;
    };
}
