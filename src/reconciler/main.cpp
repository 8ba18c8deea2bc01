// src/reconciler/main.cpp
#include "RunCoordinator.hpp"
#include "common/crypto/include/EncryptionGate.hpp"
#include "common/env/EnvManager.hpp"
#include "common/remote/include/GcloudSecretService.hpp"
#include "common/utils/logger/Logger.hpp"
#include "common/utils/process/CommandRunner.hpp"
#include <memory>
#include <string>

using namespace secret_reconciler;
using namespace secret_reconciler::env;
using namespace secret_reconciler::reconciler;

namespace
{
    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitUsage = 2;

    struct CommandLine
    {
        std::string command;
        std::string env_type;
        std::string source_root;
        std::string project;
        std::string secret;
    };

    void PrintUsage(const char* program_name)
    {
        LOG_INFOF("SecretReconciler", "Usage: %s <command> [options]", program_name);
        LOG_INFO("SecretReconciler", "");
        LOG_INFO("SecretReconciler", "Commands:");
        LOG_INFO("SecretReconciler", "  deploy      Reconcile the remote secret service with the local definitions");
        LOG_INFO("SecretReconciler", "  encrypt     Store every definition file encrypted");
        LOG_INFO("SecretReconciler", "  decrypt     Store every definition file as plaintext");
        LOG_INFO("SecretReconciler", "");
        LOG_INFO("SecretReconciler", "Options:");
        LOG_INFO("SecretReconciler", "  --source-root DIR   Directory holding the secret definitions");
        LOG_INFO("SecretReconciler", "  --project P         Remote project (deploy only)");
        LOG_INFO("SecretReconciler", "  --secret NAME       Only handle this secret");
        LOG_INFO("SecretReconciler", "  --env ENV           Load env/.env.ENV");
    }

    // 잘못된 인자면 false
    bool ParseCommandLine(int argc, char* argv[], CommandLine& cmd)
    {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto next_value = [&](std::string& target) {
                if (i + 1 >= argc) {
                    LOG_ERRORF("SecretReconciler", "✗ Missing value for %s", arg.c_str());
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--source-root") {
                if (!next_value(cmd.source_root)) return false;
            } else if (arg == "--project") {
                if (!next_value(cmd.project)) return false;
            } else if (arg == "--secret") {
                if (!next_value(cmd.secret)) return false;
            } else if (arg == "--env") {
                if (!next_value(cmd.env_type)) return false;
            } else if (!arg.empty() && arg[0] == '-') {
                LOG_ERRORF("SecretReconciler", "✗ Unknown option: %s", arg.c_str());
                return false;
            } else if (cmd.command.empty()) {
                cmd.command = arg;
            } else {
                LOG_ERRORF("SecretReconciler", "✗ Unexpected argument: %s", arg.c_str());
                return false;
            }
        }

        if (cmd.command != "deploy" && cmd.command != "encrypt" && cmd.command != "decrypt") {
            if (cmd.command.empty()) {
                LOG_ERROR("SecretReconciler", "✗ No command given");
            } else {
                LOG_ERRORF("SecretReconciler", "✗ Unknown command: %s", cmd.command.c_str());
            }
            return false;
        }

        return true;
    }

    bool IsHelpRequest(int argc, char* argv[])
    {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                return true;
            }
        }
        return false;
    }
}

int main(int argc, char* argv[])
{
    if (IsHelpRequest(argc, argv)) {
        PrintUsage(argv[0]);
        return kExitSuccess;
    }

    CommandLine cmd;
    if (!ParseCommandLine(argc, argv, cmd)) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    // 환경 설정 로드 (--env 없으면 프로세스 환경 변수만)
    if (!EnvManager::Instance().Initialize(cmd.env_type)) {
        LOG_ERRORF("SecretReconciler", "✗ Failed to load environment: %s", cmd.env_type.c_str());
        return kExitFailure;
    }

    try {
        // 로그 레벨도 env 파일 값을 따른다 (프로세스 환경 변수 우선)
        const std::string log_file = Config::GetStringOr(kLogFileKey, "");
        const std::string log_level = Config::GetStringOr(kLogLevelKey, Config::GetStringOr(kFallbackLogLevelKey, ""));
        utils::Logger::Instance().Initialize(log_file.empty() ? nullptr : log_file.c_str(),
                                             log_level.empty() ? nullptr : log_level.c_str());

        if (cmd.source_root.empty()) {
            try {
                cmd.source_root = Config::GetString(kSourceRootKey);
            } catch (const ConfigMissingException&) {
                LOG_ERRORF("SecretReconciler", "✗ --source-root is required (or set %s)", kSourceRootKey);
                PrintUsage(argv[0]);
                return kExitUsage;
            }
        }

        if (cmd.project.empty()) {
            cmd.project = Config::GetStringOr(kDefaultProjectKey, "");
        }

        RunOptions options;
        options.source_root = cmd.source_root;
        options.project = cmd.project;
        options.secret_filter = cmd.secret;

        LOG_INFOF("SecretReconciler", "=== secret-reconciler %s ===", cmd.command.c_str());
        LOG_INFOF("SecretReconciler", "  Source root: %s", options.source_root.string().c_str());
        if (!options.project.empty()) {
            LOG_INFOF("SecretReconciler", "  Project: %s", options.project.c_str());
        }
        if (!options.secret_filter.empty()) {
            LOG_INFOF("SecretReconciler", "  Secret: %s", options.secret_filter.c_str());
        }

        auto runner = std::make_shared<utils::ShellCommandRunner>();
        auto service = std::make_shared<remote::GcloudSecretService>(
            runner, Config::GetStringOr(kGcloudBinKey, "gcloud"));

        RunCoordinator coordinator(service, crypto::EncryptionGate::FromConfig(Config::Get()));

        RunResult result;
        if (cmd.command == "deploy") {
            result = coordinator.Deploy(options);
        } else if (cmd.command == "encrypt") {
            result = coordinator.EncryptFiles(options);
        } else {
            result = coordinator.DecryptFiles(options);
        }

        if (!result.overall_success) {
            if (!result.error.empty()) {
                LOG_ERRORF("SecretReconciler", "✗ %s failed: %s", cmd.command.c_str(), result.error.c_str());
            }
            return kExitFailure;
        }

        LOG_INFOF("SecretReconciler", "✓ %s finished", cmd.command.c_str());
        return kExitSuccess;

    } catch (const ConfigMissingException& e) {
        LOG_ERRORF("SecretReconciler", "✗ Configuration Error: %s", e.what());
        return kExitFailure;
    } catch (const std::exception& e) {
        LOG_ERRORF("SecretReconciler", "✗ Fatal Error: %s", e.what());
        return kExitFailure;
    }
}
