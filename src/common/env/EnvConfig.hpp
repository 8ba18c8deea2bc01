// src/common/env/EnvConfig.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <stdexcept>

namespace secret_reconciler::env
{
    // 설정 누락 예외
    class ConfigMissingException : public std::runtime_error {
    public:
        explicit ConfigMissingException(const std::string& key)
            : std::runtime_error("Required config missing: " + key) {}
    };

    /**
     * @brief KEY=VALUE 형식의 env 파일 + 프로세스 환경 변수 설정
     *
     * 조회 순서: 프로세스 환경 변수 → 로드된 env 파일.
     * 암호화 키처럼 CI 에서 주입되는 값은 환경 변수가 항상 우선한다.
     */
    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string env_type;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // 환경 설정 파일 로드
        bool LoadFromFile(const std::string& file_path);
        bool LoadFromEnv(const std::string& env_name);  // env/.env.{env_name}

        // 테스트/CLI 에서 직접 값 주입
        void Set(const std::string& key, const std::string& value);

        // 필수 값 (없거나 비어 있으면 ConfigMissingException)
        std::string GetString(const std::string& key) const;

        // 선택 값
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;

        // 환경 정보
        std::string GetEnvType() const { return env_type; }

    private:
        bool ParseLine(const std::string& line);
        bool Lookup(const std::string& key, std::string& out) const;
    };
} // namespace secret_reconciler::env
