// src/common/storage/src/DefinitionCodec.cpp
#include "common/storage/include/DefinitionCodec.hpp"
#include "common/storage/include/StorageException.hpp"
#include <set>

namespace secret_reconciler::storage
{
    using json = nlohmann::json;

    namespace
    {
        constexpr const char* kStatusField = "status";
        constexpr const char* kLabelsField = "labels";
        constexpr const char* kServiceAccountsField = "serviceAccounts";
        constexpr const char* kOnUpdateBehaviorField = "onUpdateBehavior";

        constexpr int kIndent = 2;
    }

    SecretDefinition DefinitionCodec::Parse(const std::string& content, const std::filesystem::path& path)
    {
        const std::string file = path.string();

        json document;
        try {
            document = json::parse(content);
        } catch (const json::parse_error& e) {
            throw MalformedDefinitionException(file, std::string("invalid JSON: ") + e.what());
        }

        if (!document.is_object()) {
            throw MalformedDefinitionException(file, "top-level value must be an object");
        }

        auto metadata_it = document.find(kMetadataKey);
        if (metadata_it == document.end()) {
            throw MalformedDefinitionException(file, std::string("missing '") + kMetadataKey + "' block");
        }

        SecretDefinition definition;
        definition.name = SecretNameFromPath(path);
        definition.file_path = path;
        definition.metadata = ParseMetadata(*metadata_it, file);

        document.erase(metadata_it);
        definition.payload = std::move(document);

        return definition;
    }

    SecretMetadata DefinitionCodec::ParseMetadata(const json& node, const std::string& file)
    {
        if (!node.is_object()) {
            throw MalformedDefinitionException(file, std::string("'") + kMetadataKey + "' must be an object");
        }

        SecretMetadata metadata;

        // status (필수)
        auto status_it = node.find(kStatusField);
        if (status_it == node.end() || !status_it->is_string()) {
            throw MalformedDefinitionException(file, "'status' is required and must be a string");
        }
        auto status = EncryptionStatusFromString(status_it->get<std::string>());
        if (!status) {
            throw MalformedDefinitionException(file, "'status' must be 'plaintext' or 'encrypted', got '" +
                                               status_it->get<std::string>() + "'");
        }
        metadata.status = *status;

        // labels (필수, 빈 배열 허용)
        auto labels_it = node.find(kLabelsField);
        if (labels_it == node.end()) {
            throw MalformedDefinitionException(file, "'labels' is required");
        }
        metadata.labels = ParseLabels(*labels_it, file, metadata.labels_as_object);

        // serviceAccounts (선택, null 은 없는 것으로 취급)
        auto accounts_it = node.find(kServiceAccountsField);
        if (accounts_it != node.end() && !accounts_it->is_null()) {
            if (!accounts_it->is_array()) {
                throw MalformedDefinitionException(file, "'serviceAccounts' must be an array of strings");
            }
            PrincipalSet principals;
            for (const auto& member : *accounts_it) {
                if (!member.is_string() || member.get<std::string>().empty()) {
                    throw MalformedDefinitionException(file, "'serviceAccounts' entries must be non-empty strings");
                }
                principals.insert(member.get<std::string>());
            }
            metadata.service_accounts = std::move(principals);
        }

        // onUpdateBehavior (선택, 기본 destroy, 알 수 없는 값은 보존 후 경고 대상)
        auto behavior_it = node.find(kOnUpdateBehaviorField);
        if (behavior_it != node.end() && !behavior_it->is_null()) {
            if (!behavior_it->is_string()) {
                throw MalformedDefinitionException(file, "'onUpdateBehavior' must be a string");
            }
            metadata.on_update_behavior_raw = behavior_it->get<std::string>();
            metadata.on_update_behavior = UpdateBehaviorFromString(metadata.on_update_behavior_raw);
        }

        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it.key() != kStatusField && it.key() != kLabelsField &&
                it.key() != kServiceAccountsField && it.key() != kOnUpdateBehaviorField) {
                metadata.extra_fields[it.key()] = it.value();
            }
        }

        return metadata;
    }

    LabelList DefinitionCodec::ParseLabels(const json& node, const std::string& file, bool& as_object)
    {
        LabelList labels;

        if (node.is_array()) {
            as_object = false;
            std::set<std::string> seen_keys;
            for (const auto& entry : node) {
                if (!entry.is_string()) {
                    throw MalformedDefinitionException(file, "'labels' entries must be \"key=value\" strings");
                }
                const std::string text = entry.get<std::string>();
                size_t eq_pos = text.find('=');
                if (eq_pos == std::string::npos || eq_pos == 0) {
                    throw MalformedDefinitionException(file, "label '" + text + "' is not in key=value form");
                }
                std::string key = text.substr(0, eq_pos);
                if (!seen_keys.insert(key).second) {
                    throw MalformedDefinitionException(file, "label key '" + key + "' is declared more than once");
                }
                labels.emplace_back(std::move(key), text.substr(eq_pos + 1));
            }
            return labels;
        }

        if (node.is_object()) {
            as_object = true;
            for (auto it = node.begin(); it != node.end(); ++it) {
                if (!it.value().is_string()) {
                    throw MalformedDefinitionException(file, "label '" + it.key() + "' must have a string value");
                }
                labels.emplace_back(it.key(), it.value().get<std::string>());
            }
            return labels;
        }

        throw MalformedDefinitionException(file, "'labels' must be an array or an object");
    }

    json DefinitionCodec::MetadataToJson(const SecretMetadata& metadata)
    {
        json node = metadata.extra_fields.is_object() ? metadata.extra_fields : json::object();

        node[kStatusField] = ToString(metadata.status);

        if (metadata.labels_as_object) {
            json labels = json::object();
            for (const auto& label : metadata.labels) {
                labels[label.first] = label.second;
            }
            node[kLabelsField] = std::move(labels);
        } else {
            json labels = json::array();
            for (const auto& label : metadata.labels) {
                labels.push_back(FormatLabel(label));
            }
            node[kLabelsField] = std::move(labels);
        }

        if (metadata.service_accounts) {
            node[kServiceAccountsField] = json(*metadata.service_accounts);
        }

        if (!metadata.on_update_behavior_raw.empty()) {
            node[kOnUpdateBehaviorField] = metadata.on_update_behavior_raw;
        }

        return node;
    }

    std::string DefinitionCodec::Serialize(const SecretDefinition& definition)
    {
        json document = definition.payload.is_object() ? definition.payload : json::object();
        document[kMetadataKey] = MetadataToJson(definition.metadata);
        return document.dump(kIndent) + "\n";
    }

    std::string DefinitionCodec::SerializePayload(const SecretDefinition& definition)
    {
        const json& payload = definition.payload.is_object() ? definition.payload : json::object();
        return payload.dump(kIndent) + "\n";
    }
}
