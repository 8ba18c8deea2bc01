// src/common/types/SecretsException.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace secret_reconciler
{
    /**
     * @brief 시크릿 동기화 기본 예외 클래스
     *
     * 모든 예외는 시크릿 단위 경계에서 잡혀서 해당 시크릿의 실패로 변환된다.
     * 실행 전체를 실패시키는 것은 원격 목록 조회 실패뿐이다.
     */
    class SecretsException : public std::runtime_error
    {
    public:
        explicit SecretsException(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @brief 암호화 키 미설정 등 실행 환경 문제
     */
    class ConfigurationException : public SecretsException
    {
    public:
        explicit ConfigurationException(const std::string& msg)
            : SecretsException("Configuration error: " + msg) {}
    };
}
