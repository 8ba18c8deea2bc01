// src/reconciler/RunCoordinator.cpp
#include "reconciler/RunCoordinator.hpp"
#include "common/env/EnvManager.hpp"
#include "common/remote/include/RemoteException.hpp"
#include "common/storage/include/StorageException.hpp"
#include "common/utils/logger/Logger.hpp"
#include "reconciler/guard/include/DecryptedDefinitionGuard.hpp"
#include <future>
#include <map>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace secret_reconciler::reconciler
{
    const char* ToString(SecretState state)
    {
        switch (state) {
            case SecretState::PENDING: return "pending";
            case SecretState::SKIPPED: return "skipped";
            case SecretState::DECRYPTING: return "decrypting";
            case SecretState::RECONCILING: return "reconciling";
            case SecretState::RE_ENCRYPTING: return "re-encrypting";
            case SecretState::DONE: return "done";
            default: return "unknown";
        }
    }

    RunCoordinator::RunCoordinator(std::shared_ptr<remote::ISecretService> service,
                                   crypto::EncryptionGate gate)
        : service(std::move(service))
        , gate(std::move(gate))
        , reader(this->service)
    {
    }

    // ========================================
    // deploy
    // ========================================

    RunResult RunCoordinator::Deploy(const RunOptions& options) const
    {
        RunResult result;

        if (!gate.IsEncryptionConfigured()) {
            LOG_WARNF("RunCoordinator", "%s is not set, skipping secret deployment", env::kEncryptionKeyVar);
            result.short_circuited = true;
            return result;
        }

        // 1. 로컬 정의 파일 목록
        std::vector<std::filesystem::path> files;
        try {
            files = store.ListSecretFiles(options.source_root);
        } catch (const storage::StorageException& e) {
            result.overall_success = false;
            result.error = e.what();
            LOG_ERRORF("RunCoordinator", "✗ %s", e.what());
            return result;
        }

        // 2. 원격 스냅샷 (실행당 1회, 이후 읽기 전용 공유)
        std::shared_ptr<const remote::RemoteSnapshot> snapshot;
        try {
            snapshot = reader.ListSecrets(options.project);
        } catch (const remote::RemoteServiceException& e) {
            result.overall_success = false;
            result.error = e.what();
            LOG_ERRORF("RunCoordinator", "✗ Cannot reconcile without the remote secret list: %s", e.what());
            return result;
        }

        RemoteMutator mutator(service, options.project);

        // 같은 이름을 가진 파일들 (하위 디렉터리 간 충돌) 은 원격 호출 없이 실패 처리
        std::map<std::string, std::vector<std::filesystem::path>> files_by_name;
        for (const auto& file : files) {
            files_by_name[SecretNameFromPath(file)].push_back(file);
        }

        // 3. 시크릿별 비동기 처리
        std::vector<std::pair<size_t, std::future<SecretOutcome>>> futures;
        result.outcomes.resize(files.size());

        for (size_t i = 0; i < files.size(); ++i)
        {
            const std::filesystem::path& file = files[i];
            const std::string name = SecretNameFromPath(file);

            if (!options.secret_filter.empty() && options.secret_filter != name) {
                result.outcomes[i] = SkippedOutcome(name, file);
                continue;
            }

            const auto& same_name = files_by_name[name];
            if (same_name.size() > 1) {
                result.outcomes[i] = DuplicateNameOutcome(name, file, same_name);
                continue;
            }

            try {
                auto future = std::async(std::launch::async, [this, file, snapshot, &mutator, &options]() {
                    return ReconcileSecret(file, *snapshot, mutator, options.project);
                });
                futures.emplace_back(i, std::move(future));
            } catch (const std::system_error& e) {
                // 스레드 생성 실패 시 현재 스레드에서 처리
                LOG_WARNF("RunCoordinator", "[%s] Could not start task (%s), reconciling inline", name.c_str(), e.what());
                result.outcomes[i] = ReconcileSecret(file, *snapshot, mutator, options.project);
            }
        }

        // 4. 모든 작업 대기
        for (auto& pair : futures)
        {
            const size_t index = pair.first;

            try {
                result.outcomes[index] = pair.second.get();
            } catch (const std::exception& e) {
                SecretOutcome& outcome = result.outcomes[index];
                outcome.file = files[index];
                outcome.name = SecretNameFromPath(files[index]);
                outcome.state = SecretState::DONE;
                outcome.success = false;
                outcome.error = e.what();
                LOG_ERRORF("RunCoordinator", "[%s] ✗ Task failed: %s", outcome.name.c_str(), e.what());
            }
        }

        Aggregate(result);
        LogSummary("deploy", result);
        return result;
    }

    SecretOutcome RunCoordinator::ReconcileSecret(const std::filesystem::path& file,
                                                  const remote::RemoteSnapshot& snapshot,
                                                  const RemoteMutator& mutator,
                                                  const std::string& project) const
    {
        SecretOutcome outcome;
        outcome.file = file;
        outcome.name = SecretNameFromPath(file);

        const std::string& name = outcome.name;

        try {
            SecretDefinition definition = store.ReadDefinition(file);
            const RemoteSecret* remote_secret = snapshot.Find(name);

            // 바인딩 조회는 serviceAccounts 가 선언된 기존 시크릿에 대해서만
            std::optional<PrincipalSet> current_bindings;
            if (definition.metadata.service_accounts && remote_secret) {
                try {
                    current_bindings = reader.GetAccessBindings(name, project);
                } catch (const remote::RemoteServiceException& e) {
                    LOG_WARNF("RunCoordinator", "[%s] %s", name.c_str(), e.what());
                    outcome.warnings.push_back(e.what());
                }
            }

            ReconciliationPlan plan = planner.Plan(definition, remote_secret, current_bindings);
            outcome.warnings.insert(outcome.warnings.end(), plan.warnings.begin(), plan.warnings.end());

            outcome.state = SecretState::DECRYPTING;
            DecryptedDefinitionGuard guard(store, gate, definition);

            outcome.state = SecretState::RECONCILING;
            MutationReport report = mutator.Execute(plan, guard.DataFile());
            outcome.executed = report.executed;
            outcome.warnings.insert(outcome.warnings.end(), report.warnings.begin(), report.warnings.end());

            outcome.state = SecretState::RE_ENCRYPTING;
            bool restored = guard.Restore();

            if (!report.success) {
                outcome.failed_in = SecretState::RECONCILING;
                outcome.error = report.error;
            } else if (!restored) {
                outcome.failed_in = SecretState::RE_ENCRYPTING;
                outcome.error = "failed to restore " + file.string();
            }
            outcome.success = report.success && restored;

        } catch (const std::exception& e) {
            outcome.failed_in = outcome.state;
            outcome.success = false;
            outcome.error = e.what();
        }

        outcome.state = SecretState::DONE;

        if (outcome.success) {
            LOG_INFOF("RunCoordinator", "[%s] ✓ Reconciled", name.c_str());
        } else {
            LOG_ERRORF("RunCoordinator", "[%s] ✗ Failed (%s): %s",
                       name.c_str(), ToString(outcome.failed_in), outcome.error.c_str());
        }
        return outcome;
    }

    // ========================================
    // encrypt / decrypt
    // ========================================

    RunResult RunCoordinator::EncryptFiles(const RunOptions& options) const
    {
        return TransformFiles(options, EncryptionStatus::ENCRYPTED);
    }

    RunResult RunCoordinator::DecryptFiles(const RunOptions& options) const
    {
        return TransformFiles(options, EncryptionStatus::PLAINTEXT);
    }

    RunResult RunCoordinator::TransformFiles(const RunOptions& options, EncryptionStatus target) const
    {
        const char* command = target == EncryptionStatus::ENCRYPTED ? "encrypt" : "decrypt";
        RunResult result;

        if (!gate.IsEncryptionConfigured()) {
            result.overall_success = false;
            result.error = std::string(env::kEncryptionKeyVar) + " is not set";
            LOG_ERRORF("RunCoordinator", "✗ Cannot %s secret files: %s", command, result.error.c_str());
            return result;
        }

        std::vector<std::filesystem::path> files;
        try {
            files = store.ListSecretFiles(options.source_root);
        } catch (const storage::StorageException& e) {
            result.overall_success = false;
            result.error = e.what();
            LOG_ERRORF("RunCoordinator", "✗ %s", e.what());
            return result;
        }

        for (const auto& file : files)
        {
            const std::string name = SecretNameFromPath(file);

            if (!options.secret_filter.empty() && options.secret_filter != name) {
                result.outcomes.push_back(SkippedOutcome(name, file));
                continue;
            }

            SecretOutcome outcome;
            outcome.name = name;
            outcome.file = file;

            try {
                SecretDefinition definition = store.ReadDefinition(file);

                if (definition.metadata.status == target) {
                    LOG_INFOF("RunCoordinator", "[%s] Already %s", name.c_str(), ToString(target));
                } else {
                    outcome.state = target == EncryptionStatus::ENCRYPTED ? SecretState::RE_ENCRYPTING
                                                                          : SecretState::DECRYPTING;
                    SecretDefinition transformed = target == EncryptionStatus::ENCRYPTED
                        ? gate.Encrypt(definition)
                        : gate.Decrypt(definition);
                    store.WriteDefinition(file, transformed);
                    LOG_INFOF("RunCoordinator", "[%s] ✓ Stored as %s", name.c_str(), ToString(target));
                }
                outcome.success = true;

            } catch (const std::exception& e) {
                outcome.failed_in = outcome.state;
                outcome.success = false;
                outcome.error = e.what();
                LOG_ERRORF("RunCoordinator", "[%s] ✗ %s failed: %s", name.c_str(), command, e.what());
            }

            outcome.state = SecretState::DONE;
            result.outcomes.push_back(std::move(outcome));
        }

        Aggregate(result);
        LogSummary(command, result);
        return result;
    }

    // ========================================
    // 집계
    // ========================================

    SecretOutcome RunCoordinator::SkippedOutcome(const std::string& name, const std::filesystem::path& file)
    {
        SecretOutcome outcome;
        outcome.name = name;
        outcome.file = file;
        outcome.state = SecretState::SKIPPED;
        outcome.success = true;
        LOG_DEBUGF("RunCoordinator", "[%s] Skipped by secret filter", name.c_str());
        return outcome;
    }

    SecretOutcome RunCoordinator::DuplicateNameOutcome(const std::string& name,
                                                       const std::filesystem::path& file,
                                                       const std::vector<std::filesystem::path>& same_name)
    {
        std::string paths;
        for (const auto& other : same_name) {
            if (!paths.empty()) {
                paths += ", ";
            }
            paths += other.string();
        }

        SecretOutcome outcome;
        outcome.name = name;
        outcome.file = file;
        outcome.state = SecretState::DONE;
        outcome.success = false;
        outcome.error = "secret name '" + name + "' is declared by more than one file: " + paths;
        LOG_ERRORF("RunCoordinator", "[%s] ✗ %s", name.c_str(), outcome.error.c_str());
        return outcome;
    }

    void RunCoordinator::Aggregate(RunResult& result)
    {
        result.total = result.outcomes.size();
        result.succeeded = 0;
        result.skipped = 0;
        result.failed.clear();

        for (const auto& outcome : result.outcomes) {
            if (outcome.IsSkipped()) {
                ++result.skipped;
            }
            if (outcome.success) {
                ++result.succeeded;
            } else {
                result.failed.push_back(outcome.name);
            }
        }

        result.overall_success = result.error.empty() && result.succeeded == result.total;
    }

    void RunCoordinator::LogSummary(const char* command, const RunResult& result)
    {
        LOG_INFOF("RunCoordinator", "=== %s: %zu/%zu succeeded (%zu skipped) ===",
                  command, result.succeeded, result.total, result.skipped);

        for (const auto& name : result.failed) {
            LOG_ERRORF("RunCoordinator", "  ✗ %s", name.c_str());
        }
    }
}
