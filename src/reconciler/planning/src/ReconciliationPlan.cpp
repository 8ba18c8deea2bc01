// src/reconciler/planning/src/ReconciliationPlan.cpp
#include "reconciler/planning/include/ReconciliationPlan.hpp"
#include <algorithm>

namespace secret_reconciler::reconciler
{
    const char* ToString(OperationKind kind)
    {
        switch (kind) {
            case OperationKind::CREATE: return "create";
            case OperationKind::UPDATE_LABELS: return "update-labels";
            case OperationKind::ADD_VERSION: return "add-version";
            case OperationKind::RETIRE_VERSION: return "retire-version";
            case OperationKind::GRANT_ACCESS: return "grant";
            case OperationKind::REVOKE_ACCESS: return "revoke";
            default: return "unknown";
        }
    }

    const char* ToString(RetireMode mode)
    {
        switch (mode) {
            case RetireMode::DISABLE: return "disable";
            case RetireMode::DESTROY: return "destroy";
            default: return "unknown";
        }
    }

    PlannedOperation PlannedOperation::Create(const LabelList& labels)
    {
        PlannedOperation op;
        op.kind = OperationKind::CREATE;
        op.labels = labels;
        return op;
    }

    PlannedOperation PlannedOperation::UpdateLabels(const LabelList& labels)
    {
        PlannedOperation op;
        op.kind = OperationKind::UPDATE_LABELS;
        op.labels = labels;
        return op;
    }

    PlannedOperation PlannedOperation::AddVersion()
    {
        PlannedOperation op;
        op.kind = OperationKind::ADD_VERSION;
        return op;
    }

    PlannedOperation PlannedOperation::RetireVersion(RetireMode mode)
    {
        PlannedOperation op;
        op.kind = OperationKind::RETIRE_VERSION;
        op.retire_mode = mode;
        return op;
    }

    PlannedOperation PlannedOperation::Grant(const std::string& principal)
    {
        PlannedOperation op;
        op.kind = OperationKind::GRANT_ACCESS;
        op.principal = principal;
        return op;
    }

    PlannedOperation PlannedOperation::Revoke(const std::string& principal)
    {
        PlannedOperation op;
        op.kind = OperationKind::REVOKE_ACCESS;
        op.principal = principal;
        return op;
    }

    std::string PlannedOperation::Describe() const
    {
        std::string text = ToString(kind);

        switch (kind) {
            case OperationKind::CREATE:
            case OperationKind::UPDATE_LABELS:
                text += " [" + JoinLabels(labels) + "]";
                break;
            case OperationKind::RETIRE_VERSION:
                text += std::string(" (") + ToString(retire_mode) + ")";
                break;
            case OperationKind::GRANT_ACCESS:
            case OperationKind::REVOKE_ACCESS:
                text += " " + principal;
                break;
            default:
                break;
        }
        return text;
    }

    bool ReconciliationPlan::Contains(OperationKind kind) const
    {
        return Count(kind) > 0;
    }

    size_t ReconciliationPlan::Count(OperationKind kind) const
    {
        return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
            [kind](const PlannedOperation& op) { return op.kind == kind; }));
    }

    std::vector<OperationKind> ReconciliationPlan::Kinds() const
    {
        std::vector<OperationKind> kinds;
        kinds.reserve(operations.size());
        for (const auto& op : operations) {
            kinds.push_back(op.kind);
        }
        return kinds;
    }
}
