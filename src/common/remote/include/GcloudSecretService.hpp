// src/common/remote/include/GcloudSecretService.hpp
#pragma once
#include "common/remote/include/ISecretService.hpp"
#include "common/utils/process/CommandRunner.hpp"
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace secret_reconciler::remote
{
    /**
     * @brief gcloud CLI 기반 Secret Manager 구현체
     *
     * 모든 명령은 "gcloud secrets ..." 형태이며 JSON 이 필요한 호출은 --format=json 을 붙인다.
     * 명령 실행은 ICommandRunner 에 위임 (테스트에서 명령줄 검증 가능).
     */
    class GcloudSecretService : public ISecretService
    {
    public:
        GcloudSecretService(std::shared_ptr<utils::ICommandRunner> runner,
                            std::string gcloud_bin = "gcloud");

        std::vector<RemoteSecret> ListSecrets(const std::string& project) override;

        void CreateSecret(const std::string& name,
                          const std::filesystem::path& data_file,
                          const LabelList& labels,
                          const std::string& project) override;

        std::string AddVersion(const std::string& name,
                               const std::filesystem::path& data_file,
                               const std::string& project) override;

        void UpdateLabels(const std::string& name,
                          const LabelList& labels,
                          const std::string& project) override;

        void DisableVersion(const std::string& name, const std::string& version, const std::string& project) override;
        void DestroyVersion(const std::string& name, const std::string& version, const std::string& project) override;

        PrincipalSet GetAccessBindings(const std::string& name, const std::string& project) override;
        void AddAccessBinding(const std::string& name, const std::string& member, const std::string& project) override;
        void RemoveAccessBinding(const std::string& name, const std::string& member, const std::string& project) override;

        // ========================================
        // 출력 파싱 (테스트에서 직접 사용)
        // ========================================

        // "projects/p/secrets/db" → "db"
        static std::string ShortSecretName(const std::string& resource_name);

        // "projects/p/secrets/db/versions/7" → "7"
        static std::string VersionIdFromResource(const std::string& resource_name);

        static std::vector<RemoteSecret> ParseSecretList(const std::string& json_text);
        static PrincipalSet ParseAccessorMembers(const std::string& json_text);

    private:
        std::vector<std::string> BaseCommand(std::initializer_list<std::string> args) const;
        static void AppendProject(std::vector<std::string>& argv, const std::string& project);

        utils::CommandResult Execute(const std::vector<std::string>& argv);
        // 종료 코드 + stderr 요약
        static std::string FailureDetail(const utils::CommandResult& result);

        void ChangeVersionState(const char* action, const std::string& name,
                                const std::string& version, const std::string& project);
        void ChangeAccessBinding(const char* action, const std::string& name,
                                 const std::string& member, const std::string& project);

        std::shared_ptr<utils::ICommandRunner> runner_;
        std::string gcloud_bin_;
    };
}
