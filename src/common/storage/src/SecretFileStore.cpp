// src/common/storage/src/SecretFileStore.cpp
#include "common/storage/include/SecretFileStore.hpp"
#include "common/storage/include/DefinitionCodec.hpp"
#include "common/storage/include/StorageException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

namespace secret_reconciler::storage
{
    namespace
    {
        constexpr const char* kTempMarker = ".tmp-";

        std::string RandomSuffix()
        {
            static constexpr char kHex[] = "0123456789abcdef";
            std::random_device rd;
            std::string suffix;
            for (int i = 0; i < 8; ++i) {
                suffix.push_back(kHex[rd() & 0x0F]);
            }
            return suffix;
        }

        bool IsHidden(const fs::path& path)
        {
            const std::string name = path.filename().string();
            return !name.empty() && name[0] == '.';
        }
    }

    std::vector<fs::path> SecretFileStore::ListSecretFiles(const fs::path& source_root) const
    {
        std::error_code ec;
        if (!fs::is_directory(source_root, ec)) {
            throw StorageException("source root is not a directory: " + source_root.string());
        }

        std::vector<fs::path> files;

        try {
            fs::recursive_directory_iterator it(source_root, fs::directory_options::skip_permission_denied);
            for (; it != fs::recursive_directory_iterator(); ++it) {
                const fs::path& current = it->path();

                if (IsHidden(current)) {
                    if (it->is_directory()) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }

                if (!it->is_regular_file()) {
                    continue;
                }

                if (current.extension() != ".json" || IsTemporaryFile(current)) {
                    continue;
                }

                files.push_back(current);
            }
        } catch (const fs::filesystem_error& e) {
            throw StorageException(std::string("failed to scan source root: ") + e.what());
        }

        std::sort(files.begin(), files.end());

        LOG_DEBUGF("SecretFileStore", "Found %zu secret file(s) under %s", files.size(), source_root.string().c_str());
        return files;
    }

    SecretDefinition SecretFileStore::ReadDefinition(const fs::path& path) const
    {
        return DefinitionCodec::Parse(ReadText(path), path);
    }

    void SecretFileStore::WriteDefinition(const fs::path& path, const SecretDefinition& definition) const
    {
        AtomicWrite(path, DefinitionCodec::Serialize(definition));
    }

    void SecretFileStore::WritePayloadOnly(const fs::path& path, const SecretDefinition& definition) const
    {
        AtomicWrite(path, DefinitionCodec::SerializePayload(definition));
    }

    std::string SecretFileStore::ReadText(const fs::path& path)
    {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            throw StorageException("failed to open " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        if (file.bad()) {
            throw StorageException("failed to read " + path.string());
        }

        return buffer.str();
    }

    void SecretFileStore::AtomicWrite(const fs::path& path, const std::string& content)
    {
        fs::path temp_path = path;
        temp_path += kTempMarker + RandomSuffix();

        {
            std::ofstream file(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw StorageException("failed to create temporary file " + temp_path.string());
            }

            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();

            if (!file.good()) {
                file.close();
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw StorageException("failed to write " + temp_path.string());
            }
        }

        std::error_code ec;

        // 기존 파일 권한 유지 (0600 으로 관리되는 정의 파일이 많음)
        if (fs::exists(path, ec)) {
            fs::permissions(temp_path, fs::status(path, ec).permissions(), fs::perm_options::replace, ec);
            if (ec) {
                LOG_WARNF("SecretFileStore", "Could not copy permissions to %s: %s",
                          temp_path.string().c_str(), ec.message().c_str());
                ec.clear();
            }
        }

        fs::rename(temp_path, path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw StorageException("failed to replace " + path.string() + ": " + ec.message());
        }
    }

    bool SecretFileStore::IsTemporaryFile(const fs::path& path)
    {
        return path.filename().string().find(kTempMarker) != std::string::npos;
    }
}
