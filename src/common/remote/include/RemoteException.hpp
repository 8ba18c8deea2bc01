// src/common/remote/include/RemoteException.hpp
#pragma once
#include "common/types/SecretsException.hpp"

namespace secret_reconciler::remote
{
    /**
     * @brief 원격 시크릿 서비스 호출 실패 공통
     */
    class RemoteServiceException : public SecretsException
    {
    public:
        explicit RemoteServiceException(const std::string& msg)
            : SecretsException("Remote secret service error: " + msg) {}
    };

    /**
     * @brief 시크릿 목록 조회 실패 → 실행 전체 중단
     */
    class RemoteListException : public RemoteServiceException
    {
    public:
        explicit RemoteListException(const std::string& msg)
            : RemoteServiceException("list secrets: " + msg) {}
    };

    /**
     * @brief 시크릿 생성 실패 → 해당 시크릿 실패, 남은 작업 중단
     */
    class RemoteCreateException : public RemoteServiceException
    {
    public:
        RemoteCreateException(const std::string& secret, const std::string& msg)
            : RemoteServiceException("create '" + secret + "': " + msg) {}
    };

    /**
     * @brief 새 버전 추가 실패 → 해당 시크릿 실패, 폐기/바인딩 단계 생략
     */
    class RemoteVersionException : public RemoteServiceException
    {
    public:
        RemoteVersionException(const std::string& secret, const std::string& msg)
            : RemoteServiceException("add version to '" + secret + "': " + msg) {}
    };

    /**
     * @brief 라벨/버전 폐기/바인딩 변경 실패 → 경고만, 시크릿 결과에는 영향 없음
     */
    class RemoteBestEffortException : public RemoteServiceException
    {
    public:
        RemoteBestEffortException(const std::string& operation, const std::string& secret, const std::string& msg)
            : RemoteServiceException(operation + " '" + secret + "': " + msg) {}
    };
}
