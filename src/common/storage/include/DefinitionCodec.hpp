// src/common/storage/include/DefinitionCodec.hpp
#pragma once
#include "common/types/SecretTypes.hpp"
#include <filesystem>
#include <string>

namespace secret_reconciler::storage
{
    /**
     * @brief 정의 파일 JSON ↔ SecretDefinition 변환
     *
     * 파일 형식:
     * ```json
     * {
     *   "__gcp_metadata": {
     *     "status": "plaintext",
     *     "labels": ["env=prod"],
     *     "serviceAccounts": ["serviceAccount:api@p.iam.gserviceaccount.com"],
     *     "onUpdateBehavior": "destroy"
     *   },
     *   "DB_PASSWORD": "..."
     * }
     * ```
     */
    class DefinitionCodec
    {
    public:
        /**
         * @throws MalformedDefinitionException
         */
        static SecretDefinition Parse(const std::string& content, const std::filesystem::path& path);

        // 메타데이터 포함 전체 문서
        static std::string Serialize(const SecretDefinition& definition);

        // 원격 서비스에 업로드되는 payload 문서 (메타데이터 제외)
        static std::string SerializePayload(const SecretDefinition& definition);

    private:
        DefinitionCodec() = delete;

        static SecretMetadata ParseMetadata(const nlohmann::json& node, const std::string& file);
        static LabelList ParseLabels(const nlohmann::json& node, const std::string& file, bool& as_object);
        static nlohmann::json MetadataToJson(const SecretMetadata& metadata);
    };
}
