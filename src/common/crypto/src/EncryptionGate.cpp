// src/common/crypto/src/EncryptionGate.cpp
#include "common/crypto/include/EncryptionGate.hpp"
#include "common/crypto/include/CryptoException.hpp"
#include "common/env/EnvConfig.hpp"
#include "common/env/EnvManager.hpp"

namespace secret_reconciler::crypto
{
    using json = nlohmann::json;

    EncryptionGate::EncryptionGate(const std::string& passphrase)
    {
        if (!passphrase.empty()) {
            cipher = std::make_unique<ValueCipher>(passphrase);
        }
    }

    EncryptionGate EncryptionGate::FromConfig(const env::EnvConfig& config)
    {
        return EncryptionGate(config.GetStringOr(env::kEncryptionKeyVar, ""));
    }

    const ValueCipher& EncryptionGate::RequireCipher() const
    {
        if (!cipher) {
            throw ConfigurationException(std::string(env::kEncryptionKeyVar) + " is not set");
        }
        return *cipher;
    }

    SecretDefinition EncryptionGate::Decrypt(const SecretDefinition& definition) const
    {
        SecretDefinition result = definition;
        if (!definition.IsEncrypted()) {
            return result;
        }

        const ValueCipher& value_cipher = RequireCipher();

        json decrypted = json::object();
        for (auto it = definition.payload.begin(); it != definition.payload.end(); ++it) {
            if (!it.value().is_string()) {
                throw DecryptionException("value '" + it.key() + "' of '" + definition.name + "' is not encrypted");
            }

            std::string plaintext;
            try {
                plaintext = value_cipher.Decrypt(it.value().get<std::string>());
            } catch (const DecryptionException& e) {
                throw DecryptionException("value '" + it.key() + "' of '" + definition.name + "': " + e.what());
            }

            try {
                decrypted[it.key()] = json::parse(plaintext);
            } catch (const json::parse_error&) {
                throw DecryptionException("value '" + it.key() + "' of '" + definition.name + "' is not valid JSON after decryption");
            }
        }

        result.payload = std::move(decrypted);
        result.metadata.status = EncryptionStatus::PLAINTEXT;
        return result;
    }

    SecretDefinition EncryptionGate::Encrypt(const SecretDefinition& definition) const
    {
        SecretDefinition result = definition;
        if (definition.IsEncrypted()) {
            return result;
        }

        const ValueCipher& value_cipher = RequireCipher();

        // 값의 JSON 직렬화를 암호화하므로 숫자/객체 타입도 복호화 후 그대로 복원된다
        json encrypted = json::object();
        for (auto it = definition.payload.begin(); it != definition.payload.end(); ++it) {
            encrypted[it.key()] = value_cipher.Encrypt(it.value().dump());
        }

        result.payload = std::move(encrypted);
        result.metadata.status = EncryptionStatus::ENCRYPTED;
        return result;
    }
}
