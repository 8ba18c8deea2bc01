// src/reconciler/mutation/src/RemoteMutator.cpp
#include "reconciler/mutation/include/RemoteMutator.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace secret_reconciler::reconciler
{
    using namespace secret_reconciler::remote;

    namespace
    {
        // 생성/버전 추가 실패만 시크릿 실패로 이어진다
        bool IsFatal(OperationKind kind)
        {
            return kind == OperationKind::CREATE || kind == OperationKind::ADD_VERSION;
        }
    }

    RemoteMutator::RemoteMutator(std::shared_ptr<ISecretService> service, std::string project)
        : service(std::move(service))
        , project(std::move(project))
    {
        if (!this->service) {
            throw std::invalid_argument("RemoteMutator requires a secret service");
        }
    }

    MutationReport RemoteMutator::Execute(const ReconciliationPlan& plan,
                                          const std::filesystem::path& data_file) const
    {
        MutationReport report;
        const std::string& secret = plan.secret_name;

        for (const auto& op : plan.operations) {
            try {
                ExecuteOne(secret, op, data_file, report);
            } catch (const std::exception& e) {
                if (IsFatal(op.kind)) {
                    report.success = false;
                    report.error = e.what();
                    LOG_ERRORF("RemoteMutator", "[%s] ✗ %s failed, remaining operations skipped: %s",
                               secret.c_str(), op.Describe().c_str(), e.what());
                    break;
                }

                LOG_WARNF("RemoteMutator", "[%s] ✗ %s failed: %s", secret.c_str(), op.Describe().c_str(), e.what());
                report.warnings.push_back(op.Describe() + ": " + e.what());
            }
        }

        return report;
    }

    void RemoteMutator::ExecuteOne(const std::string& secret,
                                   const PlannedOperation& op,
                                   const std::filesystem::path& data_file,
                                   MutationReport& report) const
    {
        switch (op.kind) {
            case OperationKind::CREATE:
                LOG_INFOF("RemoteMutator", "Creating secret \"%s\" from file \"%s\"",
                          secret.c_str(), data_file.filename().string().c_str());
                service->CreateSecret(secret, data_file, op.labels, project);
                break;

            case OperationKind::UPDATE_LABELS:
                LOG_INFOF("RemoteMutator", "Updating labels of \"%s\" to [%s]",
                          secret.c_str(), JoinLabels(op.labels).c_str());
                service->UpdateLabels(secret, op.labels, project);
                break;

            case OperationKind::ADD_VERSION:
                report.new_version = service->AddVersion(secret, data_file, project);
                LOG_INFOF("RemoteMutator", "Added version %s to \"%s\"",
                          report.new_version.c_str(), secret.c_str());
                break;

            case OperationKind::RETIRE_VERSION:
                RetirePreviousVersion(secret, op.retire_mode, report);
                return;

            case OperationKind::GRANT_ACCESS:
                LOG_INFOF("RemoteMutator", "Granting \"%s\" access to \"%s\"", op.principal.c_str(), secret.c_str());
                service->AddAccessBinding(secret, op.principal, project);
                break;

            case OperationKind::REVOKE_ACCESS:
                LOG_INFOF("RemoteMutator", "Revoking \"%s\" access to \"%s\"", op.principal.c_str(), secret.c_str());
                service->RemoveAccessBinding(secret, op.principal, project);
                break;

            default:
                throw std::logic_error("unknown operation kind");
        }

        report.executed.push_back(op.Describe());
    }

    void RemoteMutator::RetirePreviousVersion(const std::string& secret,
                                              RetireMode mode,
                                              MutationReport& report) const
    {
        // 새 버전이 확인된 경우에만 직전 버전을 폐기
        if (report.new_version.empty()) {
            report.warnings.push_back("retire-version skipped: no new version was added");
            LOG_WARNF("RemoteMutator", "[%s] Retirement skipped, no new version was added", secret.c_str());
            return;
        }

        long new_version = 0;
        try {
            size_t consumed = 0;
            new_version = std::stol(report.new_version, &consumed);
            if (consumed != report.new_version.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception&) {
            report.warnings.push_back("retire-version skipped: version \"" + report.new_version + "\" is not numeric");
            LOG_WARNF("RemoteMutator", "[%s] Retirement skipped, version \"%s\" is not numeric",
                      secret.c_str(), report.new_version.c_str());
            return;
        }

        long previous = new_version - 1;
        if (previous < 1) {
            LOG_DEBUGF("RemoteMutator", "[%s] No previous version to retire", secret.c_str());
            return;
        }

        const std::string previous_id = std::to_string(previous);
        LOG_INFOF("RemoteMutator", "%s previous version %s of secret \"%s\"",
                  mode == RetireMode::DISABLE ? "Disabling" : "Destroying",
                  previous_id.c_str(), secret.c_str());

        if (mode == RetireMode::DISABLE) {
            service->DisableVersion(secret, previous_id, project);
        } else {
            service->DestroyVersion(secret, previous_id, project);
        }

        report.executed.push_back(std::string(ToString(OperationKind::RETIRE_VERSION)) + " (" +
                                  ToString(mode) + " " + previous_id + ")");
    }
}
