// src/common/storage/include/SecretFileStore.hpp
#pragma once
#include "common/types/SecretTypes.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace secret_reconciler::storage
{
    namespace fs = std::filesystem;

    /**
     * @brief 시크릿 정의 파일 읽기/쓰기
     *
     * 모든 쓰기는 임시 파일에 기록 후 rename 하는 원자적 교체.
     * 프로세스가 쓰기 도중 중단되어도 정의 파일이 반쯤 쓰인 상태로 남지 않는다.
     */
    class SecretFileStore
    {
    public:
        SecretFileStore() = default;

        /**
         * @brief 소스 루트 아래의 모든 정의 파일 (*.json, 재귀)
         *
         * 숨김 파일/디렉토리와 쓰기 중 남은 임시 파일은 제외.
         * 결과는 경로 사전순 정렬 (실행마다 같은 순서).
         *
         * @throws StorageException 소스 루트가 없거나 디렉토리가 아닐 때
         */
        std::vector<fs::path> ListSecretFiles(const fs::path& source_root) const;

        /**
         * @throws StorageException 파일을 읽을 수 없을 때
         * @throws MalformedDefinitionException 형식 오류
         */
        SecretDefinition ReadDefinition(const fs::path& path) const;

        // 메타데이터 포함 전체 문서를 원자적으로 기록
        void WriteDefinition(const fs::path& path, const SecretDefinition& definition) const;

        // 업로드용 payload 문서 (메타데이터 제외) 를 원자적으로 기록
        void WritePayloadOnly(const fs::path& path, const SecretDefinition& definition) const;

    private:
        static std::string ReadText(const fs::path& path);
        static void AtomicWrite(const fs::path& path, const std::string& content);
        static bool IsTemporaryFile(const fs::path& path);
    };
}
