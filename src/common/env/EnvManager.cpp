// src/common/env/EnvManager.cpp
#include "common/env/EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace secret_reconciler::env
{
    // 정적 멤버 초기화
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자라 make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    bool EnvManager::Initialize(const std::string& env_type)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            LOG_DEBUGF("EnvManager", "Already initialized. Current env: '%s', requested: '%s'",
                       env_config->GetEnvType().c_str(), env_type.c_str());
            return env_config->GetEnvType() == env_type;
        }

        auto config = std::make_unique<EnvConfig>();

        if (!env_type.empty() && !config->LoadFromEnv(env_type)) {
            LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", env_type.c_str());
            return false;
        }

        env_config = std::move(config);
        is_initialized = true;

        if (env_type.empty()) {
            LOG_DEBUG("EnvManager", "Initialized from process environment only");
        } else {
            LOG_INFOF("EnvManager", "✓ Loaded environment: %s", env_type.c_str());
        }
        return true;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw std::runtime_error(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize(env_type) first."
            );
        }
    }

    std::string EnvManager::GetString(const std::string& key) const
    {
        return GetConfig().GetString(key);
    }

    std::string EnvManager::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        return GetConfig().GetStringOr(key, default_value);
    }

} // namespace secret_reconciler::env
