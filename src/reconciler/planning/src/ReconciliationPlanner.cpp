// src/reconciler/planning/src/ReconciliationPlanner.cpp
#include "reconciler/planning/include/ReconciliationPlanner.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <iterator>

namespace secret_reconciler::reconciler
{
    ReconciliationPlan ReconciliationPlanner::Plan(const SecretDefinition& definition,
                                                   const RemoteSecret* remote,
                                                   const std::optional<PrincipalSet>& current_bindings) const
    {
        ReconciliationPlan plan;
        plan.secret_name = definition.name;

        // ========================================
        // 1. 존재 여부
        // ========================================
        if (!remote) {
            // 생성 시 라벨이 함께 붙으므로 라벨 갱신/버전 추가는 계획하지 않는다
            plan.operations.push_back(PlannedOperation::Create(definition.metadata.labels));
        } else {
            PlanExisting(definition, *remote, plan);
        }

        // ========================================
        // 2. 접근 바인딩 (serviceAccounts 선언 시에만)
        // ========================================
        const auto& declared = definition.metadata.service_accounts;
        if (declared) {
            if (!remote) {
                PlanAccessBindings(*declared, PrincipalSet{}, plan);
            } else if (current_bindings) {
                PlanAccessBindings(*declared, *current_bindings, plan);
            } else {
                std::string warning = "current access bindings of \"" + definition.name +
                                      "\" are unknown, binding changes skipped";
                LOG_WARNF("Planner", "%s", warning.c_str());
                plan.warnings.push_back(std::move(warning));
            }
        }

        return plan;
    }

    void ReconciliationPlanner::PlanExisting(const SecretDefinition& definition,
                                             const RemoteSecret& remote,
                                             ReconciliationPlan& plan) const
    {
        const SecretMetadata& metadata = definition.metadata;

        // 라벨은 버전이 아닌 시크릿 자체에 붙으므로 버전 추가보다 먼저
        if (LabelsDiffer(metadata.labels, remote.labels)) {
            plan.operations.push_back(PlannedOperation::UpdateLabels(metadata.labels));
        }

        // payload 비교 없이 매 실행마다 새 버전
        plan.operations.push_back(PlannedOperation::AddVersion());

        switch (metadata.on_update_behavior) {
            case UpdateBehavior::NONE:
                break;
            case UpdateBehavior::DISABLE:
                plan.operations.push_back(PlannedOperation::RetireVersion(RetireMode::DISABLE));
                break;
            case UpdateBehavior::DESTROY:
                plan.operations.push_back(PlannedOperation::RetireVersion(RetireMode::DESTROY));
                break;
            case UpdateBehavior::UNRECOGNIZED:
            default: {
                std::string warning = "\"" + metadata.on_update_behavior_raw +
                                      "\" is an invalid onUpdateBehavior, valid are: \"none\", \"disable\" or \"destroy\"";
                LOG_WARNF("Planner", "[%s] %s", definition.name.c_str(), warning.c_str());
                plan.warnings.push_back(std::move(warning));
                break;
            }
        }
    }

    void ReconciliationPlanner::PlanAccessBindings(const PrincipalSet& declared,
                                                   const PrincipalSet& current,
                                                   ReconciliationPlan& plan) const
    {
        std::vector<std::string> to_revoke;
        std::set_difference(current.begin(), current.end(),
                            declared.begin(), declared.end(),
                            std::back_inserter(to_revoke));

        std::vector<std::string> to_grant;
        std::set_difference(declared.begin(), declared.end(),
                            current.begin(), current.end(),
                            std::back_inserter(to_grant));

        for (const auto& principal : to_revoke) {
            plan.operations.push_back(PlannedOperation::Revoke(principal));
        }
        for (const auto& principal : to_grant) {
            plan.operations.push_back(PlannedOperation::Grant(principal));
        }
    }

    bool ReconciliationPlanner::LabelsDiffer(const LabelList& declared,
                                             const std::map<std::string, std::string>& remote)
    {
        return LabelSet(declared) != LabelSet(remote);
    }
}
