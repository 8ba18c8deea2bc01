// src/common/storage/include/StorageException.hpp
#pragma once
#include "common/types/SecretsException.hpp"

namespace secret_reconciler::storage
{
    /**
     * @brief 파일 시스템 오류 (열기/쓰기/rename 실패, 소스 루트 없음)
     */
    class StorageException : public SecretsException
    {
    public:
        explicit StorageException(const std::string& msg)
            : SecretsException("Storage error: " + msg) {}
    };

    /**
     * @brief 정의 파일 형식 오류 (JSON 파싱 실패, 필수 메타데이터 누락/타입 불일치)
     */
    class MalformedDefinitionException : public SecretsException
    {
    public:
        MalformedDefinitionException(const std::string& file, const std::string& reason)
            : SecretsException("Malformed secret definition '" + file + "': " + reason) {}
    };
}
