// src/common/remote/src/GcloudSecretService.cpp
#include "common/remote/include/GcloudSecretService.hpp"
#include "common/remote/include/RemoteException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace secret_reconciler::remote
{
    namespace
    {
        constexpr const char* kSecretsSegment = "/secrets/";
        constexpr const char* kVersionsSegment = "/versions/";
        constexpr size_t kMaxDetailLength = 512;

        std::string Trim(const std::string& value)
        {
            const char* ws = " \t\r\n";
            size_t begin = value.find_first_not_of(ws);
            if (begin == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(ws);
            return value.substr(begin, end - begin + 1);
        }
    }

    GcloudSecretService::GcloudSecretService(std::shared_ptr<utils::ICommandRunner> runner,
                                             std::string gcloud_bin)
        : runner_(std::move(runner))
        , gcloud_bin_(std::move(gcloud_bin))
    {
        if (!runner_) {
            throw std::invalid_argument("GcloudSecretService requires a command runner");
        }
        if (gcloud_bin_.empty()) {
            gcloud_bin_ = "gcloud";
        }
    }

    // ========================================
    // 조회
    // ========================================

    std::vector<RemoteSecret> GcloudSecretService::ListSecrets(const std::string& project)
    {
        auto argv = BaseCommand({"list", "--format=json"});
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteListException(FailureDetail(result));
        }

        std::vector<RemoteSecret> secrets;
        try {
            secrets = ParseSecretList(result.stdout_text);
        } catch (const std::exception& e) {
            throw RemoteListException(std::string("unexpected output: ") + e.what());
        }

        LOG_DEBUGF("GcloudSecretService", "Listed %zu remote secret(s)%s%s",
                   secrets.size(), project.empty() ? "" : " in project ", project.c_str());
        return secrets;
    }

    PrincipalSet GcloudSecretService::GetAccessBindings(const std::string& name, const std::string& project)
    {
        auto argv = BaseCommand({"get-iam-policy", name, "--format=json"});
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteBestEffortException("get access bindings of", name, FailureDetail(result));
        }

        try {
            return ParseAccessorMembers(result.stdout_text);
        } catch (const std::exception& e) {
            throw RemoteBestEffortException("get access bindings of", name,
                                            std::string("unexpected output: ") + e.what());
        }
    }

    // ========================================
    // 생성 / 버전
    // ========================================

    void GcloudSecretService::CreateSecret(const std::string& name,
                                           const std::filesystem::path& data_file,
                                           const LabelList& labels,
                                           const std::string& project)
    {
        auto argv = BaseCommand({"create", name,
                                 "--data-file=" + data_file.string(),
                                 "--replication-policy=automatic"});
        if (!labels.empty()) {
            argv.push_back("--labels=" + JoinLabels(labels));
        }
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteCreateException(name, FailureDetail(result));
        }
    }

    std::string GcloudSecretService::AddVersion(const std::string& name,
                                                const std::filesystem::path& data_file,
                                                const std::string& project)
    {
        auto argv = BaseCommand({"versions", "add", name,
                                 "--data-file=" + data_file.string(),
                                 "--format=json"});
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteVersionException(name, FailureDetail(result));
        }

        std::string version;
        try {
            json response = json::parse(result.stdout_text);
            version = VersionIdFromResource(response.at("name").get<std::string>());
        } catch (const json::exception& e) {
            throw RemoteVersionException(name, std::string("unexpected output: ") + e.what());
        }

        if (version.empty()) {
            throw RemoteVersionException(name, "response did not name the new version");
        }
        return version;
    }

    // ========================================
    // Best-effort 변경
    // ========================================

    void GcloudSecretService::UpdateLabels(const std::string& name,
                                           const LabelList& labels,
                                           const std::string& project)
    {
        auto argv = BaseCommand({"update", name, "--clear-labels"});
        if (!labels.empty()) {
            argv.push_back("--update-labels=" + JoinLabels(labels));
        }
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteBestEffortException("update labels of", name, FailureDetail(result));
        }
    }

    void GcloudSecretService::DisableVersion(const std::string& name, const std::string& version,
                                             const std::string& project)
    {
        ChangeVersionState("disable", name, version, project);
    }

    void GcloudSecretService::DestroyVersion(const std::string& name, const std::string& version,
                                             const std::string& project)
    {
        ChangeVersionState("destroy", name, version, project);
    }

    void GcloudSecretService::AddAccessBinding(const std::string& name, const std::string& member,
                                               const std::string& project)
    {
        ChangeAccessBinding("add-iam-policy-binding", name, member, project);
    }

    void GcloudSecretService::RemoveAccessBinding(const std::string& name, const std::string& member,
                                                  const std::string& project)
    {
        ChangeAccessBinding("remove-iam-policy-binding", name, member, project);
    }

    void GcloudSecretService::ChangeVersionState(const char* action, const std::string& name,
                                                 const std::string& version, const std::string& project)
    {
        auto argv = BaseCommand({"versions", action, version, "--secret=" + name, "--quiet"});
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteBestEffortException(std::string(action) + " version " + version + " of",
                                            name, FailureDetail(result));
        }
    }

    void GcloudSecretService::ChangeAccessBinding(const char* action, const std::string& name,
                                                  const std::string& member, const std::string& project)
    {
        auto argv = BaseCommand({action, name,
                                 "--member=" + member,
                                 std::string("--role=") + kSecretAccessorRole});
        AppendProject(argv, project);

        auto result = Execute(argv);
        if (!result.Succeeded()) {
            throw RemoteBestEffortException(std::string(action) + " " + member + " on",
                                            name, FailureDetail(result));
        }
    }

    // ========================================
    // 출력 파싱
    // ========================================

    std::string GcloudSecretService::ShortSecretName(const std::string& resource_name)
    {
        size_t pos = resource_name.rfind(kSecretsSegment);
        if (pos == std::string::npos) {
            return resource_name;
        }
        return resource_name.substr(pos + std::char_traits<char>::length(kSecretsSegment));
    }

    std::string GcloudSecretService::VersionIdFromResource(const std::string& resource_name)
    {
        size_t pos = resource_name.rfind(kVersionsSegment);
        if (pos == std::string::npos) {
            return resource_name;
        }
        return resource_name.substr(pos + std::char_traits<char>::length(kVersionsSegment));
    }

    std::vector<RemoteSecret> GcloudSecretService::ParseSecretList(const std::string& json_text)
    {
        std::vector<RemoteSecret> secrets;

        // 시크릿이 하나도 없으면 gcloud 는 빈 출력 또는 [] 를 낸다
        if (Trim(json_text).empty()) {
            return secrets;
        }

        json listing = json::parse(json_text);
        if (!listing.is_array()) {
            throw std::runtime_error("secret listing is not a JSON array");
        }

        for (const auto& entry : listing) {
            RemoteSecret secret;
            secret.name = ShortSecretName(entry.at("name").get<std::string>());

            auto labels = entry.find("labels");
            if (labels != entry.end() && labels->is_object()) {
                for (auto it = labels->begin(); it != labels->end(); ++it) {
                    secret.labels[it.key()] = it.value().is_string()
                        ? it.value().get<std::string>()
                        : it.value().dump();
                }
            }

            secrets.push_back(std::move(secret));
        }

        return secrets;
    }

    PrincipalSet GcloudSecretService::ParseAccessorMembers(const std::string& json_text)
    {
        PrincipalSet members;

        if (Trim(json_text).empty()) {
            return members;
        }

        json policy = json::parse(json_text);
        auto bindings = policy.find("bindings");
        if (bindings == policy.end() || !bindings->is_array()) {
            return members;
        }

        for (const auto& binding : *bindings) {
            if (binding.value("role", "") != kSecretAccessorRole) {
                continue;
            }
            auto list = binding.find("members");
            if (list == binding.end() || !list->is_array()) {
                continue;
            }
            for (const auto& member : *list) {
                members.insert(member.get<std::string>());
            }
        }

        return members;
    }

    // ========================================
    // 내부
    // ========================================

    std::vector<std::string> GcloudSecretService::BaseCommand(std::initializer_list<std::string> args) const
    {
        std::vector<std::string> argv{gcloud_bin_, "secrets"};
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }

    void GcloudSecretService::AppendProject(std::vector<std::string>& argv, const std::string& project)
    {
        if (!project.empty()) {
            argv.push_back("--project=" + project);
        }
    }

    utils::CommandResult GcloudSecretService::Execute(const std::vector<std::string>& argv)
    {
        return runner_->Run(argv);
    }

    std::string GcloudSecretService::FailureDetail(const utils::CommandResult& result)
    {
        std::string detail = "exit code " + std::to_string(result.exit_code);

        std::string err = Trim(result.stderr_text);
        if (!err.empty()) {
            if (err.size() > kMaxDetailLength) {
                err = err.substr(0, kMaxDetailLength) + "...";
            }
            detail += ": " + err;
        }
        return detail;
    }
}
