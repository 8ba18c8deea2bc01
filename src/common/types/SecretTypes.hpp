// src/common/types/SecretTypes.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace secret_reconciler
{
    // 정의 파일 안에서 메타데이터가 들어가는 예약 키
    inline constexpr const char* kMetadataKey = "__gcp_metadata";

    // 접근 바인딩을 관리하는 고정 역할
    inline constexpr const char* kSecretAccessorRole = "roles/secretmanager.secretAccessor";

    enum class EncryptionStatus
    {
        PLAINTEXT = 0,
        ENCRYPTED
    };

    enum class UpdateBehavior
    {
        NONE = 0,
        DISABLE,
        DESTROY,
        UNRECOGNIZED = 99   // 파싱은 성공, 폐기 단계만 건너뜀
    };

    using Label = std::pair<std::string, std::string>;
    using LabelList = std::vector<Label>;
    using PrincipalSet = std::set<std::string>;

    /**
     * @brief 정의 파일의 __gcp_metadata 블록 (파싱 시점에 검증됨)
     */
    struct SecretMetadata
    {
        EncryptionStatus status = EncryptionStatus::PLAINTEXT;
        LabelList labels;
        bool labels_as_object = false;                  // 파일에 { "k": "v" } 형식으로 적혀 있었는지
        std::optional<PrincipalSet> service_accounts;   // 없으면 바인딩 미관리
        UpdateBehavior on_update_behavior = UpdateBehavior::DESTROY;
        std::string on_update_behavior_raw;             // 파일에 적힌 원문 (없으면 빈 문자열)
        nlohmann::json extra_fields = nlohmann::json::object();  // 알 수 없는 메타데이터 (다시 쓸 때 보존)
    };

    /**
     * @brief 로컬에 선언된 시크릿 하나
     *
     * payload 는 메타데이터를 제외한 최상위 멤버 전체 (JSON object).
     * 암호화 상태에서는 각 값이 "iv:ciphertext:tag" 문자열이다.
     */
    struct SecretDefinition
    {
        std::string name;
        std::filesystem::path file_path;
        nlohmann::json payload = nlohmann::json::object();
        SecretMetadata metadata;

        bool IsEncrypted() const { return metadata.status == EncryptionStatus::ENCRYPTED; }
    };

    /**
     * @brief 원격 서비스 목록 조회 결과 (실행 시점 스냅샷)
     */
    struct RemoteSecret
    {
        std::string name;
        std::map<std::string, std::string> labels;
    };

    const char* ToString(EncryptionStatus status);
    std::optional<EncryptionStatus> EncryptionStatusFromString(const std::string& value);

    const char* ToString(UpdateBehavior behavior);
    UpdateBehavior UpdateBehaviorFromString(const std::string& value);

    // "key=value"
    std::string FormatLabel(const Label& label);

    // "a=1,b=2" (선언 순서 유지)
    std::string JoinLabels(const LabelList& labels);

    // 순서 무관 비교용 "key=value" 집합
    std::set<std::string> LabelSet(const LabelList& labels);
    std::set<std::string> LabelSet(const std::map<std::string, std::string>& labels);

    /**
     * @brief 파일 경로에서 시크릿 이름 도출 (마지막 확장자만 제거)
     *
     * "secrets/db.secret.json" → "db.secret"
     */
    std::string SecretNameFromPath(const std::filesystem::path& path);

} // namespace secret_reconciler
