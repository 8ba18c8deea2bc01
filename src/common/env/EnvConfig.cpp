// src/common/env/EnvConfig.cpp
#include "common/env/EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <cstdlib>

namespace secret_reconciler::env
{
    namespace
    {
        std::string Trim(const std::string& value, const char* whitespace = " \t\r\n")
        {
            size_t start = value.find_first_not_of(whitespace);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(whitespace);
            return value.substr(start, end - start + 1);
        }
    }

    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }
        config_map.clear();

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_no, file_path.c_str());
            }
        }

        LOG_DEBUGF("EnvConfig", "Loaded %zu configuration entries from %s", config_map.size(), file_path.c_str());
        return true;
    }

    bool EnvConfig::LoadFromEnv(const std::string& env_name)
    {
        env_type = env_name;
        std::string file_path = "env/.env." + env_name;
        return LoadFromFile(file_path);
    }

    void EnvConfig::Set(const std::string& key, const std::string& value)
    {
        config_map[key] = value;
    }

    bool EnvConfig::Lookup(const std::string& key, std::string& out) const
    {
        const char* from_process = std::getenv(key.c_str());
        if (from_process && *from_process) {
            out = from_process;
            return true;
        }

        auto it = config_map.find(key);
        if (it != config_map.end() && !it->second.empty()) {
            out = it->second;
            return true;
        }
        return false;
    }

    // ========================================
    // 필수 값 (없으면 예외)
    // ========================================

    std::string EnvConfig::GetString(const std::string& key) const
    {
        std::string value;
        if (!Lookup(key, value)) {
            throw ConfigMissingException(key);
        }
        return value;
    }

    std::string EnvConfig::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        std::string value;
        return Lookup(key, value) ? value : default_value;
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        std::string trimmed = Trim(line);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        // "export KEY=VALUE" 형식 허용
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = Trim(trimmed.substr(7));
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = Trim(trimmed.substr(0, eq_pos), " \t");
        std::string value = Trim(trimmed.substr(eq_pos + 1), " \t");

        // 양쪽 따옴표 제거
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (key.empty())
        {
            return false;
        }

        config_map[key] = value;
        return true;
    }
} // namespace secret_reconciler::env
