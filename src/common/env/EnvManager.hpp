// src/common/env/EnvManager.hpp
#pragma once
#include "EnvConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace secret_reconciler::env
{
    // 설정 키
    inline constexpr const char* kEncryptionKeyVar = "GCP_SECRETS_ENCRYPTION_KEY";
    inline constexpr const char* kGcloudBinKey = "SECRETS_GCLOUD_BIN";
    inline constexpr const char* kDefaultProjectKey = "SECRETS_DEFAULT_PROJECT";
    inline constexpr const char* kSourceRootKey = "SECRETS_SOURCE_ROOT";
    inline constexpr const char* kLogFileKey = "SECRETS_LOG_FILE";
    inline constexpr const char* kLogLevelKey = "SECRETS_LOG_LEVEL";
    inline constexpr const char* kFallbackLogLevelKey = "LOG_LEVEL";

    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * --env 가 주어지면 env/.env.{env} 파일을 로드하고,
     * 주어지지 않으면 프로세스 환경 변수만으로 동작한다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        mutable std::mutex config_mutex;

        bool is_initialized = false;

        EnvManager() = default;

    public:
        ~EnvManager() = default;

        // 복사/이동 방지
        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        static EnvManager& Instance();

        /**
         * @brief 환경 설정 초기화
         * @param env_type 환경 이름 (빈 문자열이면 env 파일 없이 초기화)
         * @return 초기화 성공 여부
         */
        bool Initialize(const std::string& env_type);

        /**
         * @brief 환경 설정 객체 접근
         * @return EnvConfig 참조 (초기화되지 않았으면 예외 발생)
         */
        const EnvConfig& GetConfig() const;

        std::string GetString(const std::string& key) const;
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;

    private:
        void EnsureInitialized() const;
    };

    /**
     * @brief 전역 설정 접근을 위한 편의 함수들
     */
    namespace Config
    {
        inline const EnvConfig& Get() {
            return EnvManager::Instance().GetConfig();
        }

        inline std::string GetString(const std::string& key) {
            return EnvManager::Instance().GetString(key);
        }

        inline std::string GetStringOr(const std::string& key, const std::string& default_value) {
            return EnvManager::Instance().GetStringOr(key, default_value);
        }
    }

} // namespace secret_reconciler::env
