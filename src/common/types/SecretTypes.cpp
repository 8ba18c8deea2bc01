// src/common/types/SecretTypes.cpp
#include "common/types/SecretTypes.hpp"

namespace secret_reconciler
{
    const char* ToString(EncryptionStatus status)
    {
        switch (status) {
            case EncryptionStatus::PLAINTEXT: return "plaintext";
            case EncryptionStatus::ENCRYPTED: return "encrypted";
            default: return "unknown";
        }
    }

    std::optional<EncryptionStatus> EncryptionStatusFromString(const std::string& value)
    {
        if (value == "plaintext") return EncryptionStatus::PLAINTEXT;
        if (value == "encrypted") return EncryptionStatus::ENCRYPTED;
        return std::nullopt;
    }

    const char* ToString(UpdateBehavior behavior)
    {
        switch (behavior) {
            case UpdateBehavior::NONE: return "none";
            case UpdateBehavior::DISABLE: return "disable";
            case UpdateBehavior::DESTROY: return "destroy";
            default: return "unrecognized";
        }
    }

    UpdateBehavior UpdateBehaviorFromString(const std::string& value)
    {
        if (value == "none") return UpdateBehavior::NONE;
        if (value == "disable") return UpdateBehavior::DISABLE;
        if (value == "destroy") return UpdateBehavior::DESTROY;
        return UpdateBehavior::UNRECOGNIZED;
    }

    std::string FormatLabel(const Label& label)
    {
        return label.first + "=" + label.second;
    }

    std::string JoinLabels(const LabelList& labels)
    {
        std::string joined;
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) {
                joined += ",";
            }
            joined += FormatLabel(labels[i]);
        }
        return joined;
    }

    std::set<std::string> LabelSet(const LabelList& labels)
    {
        std::set<std::string> result;
        for (const auto& label : labels) {
            result.insert(FormatLabel(label));
        }
        return result;
    }

    std::set<std::string> LabelSet(const std::map<std::string, std::string>& labels)
    {
        std::set<std::string> result;
        for (const auto& [key, value] : labels) {
            result.insert(key + "=" + value);
        }
        return result;
    }

    std::string SecretNameFromPath(const std::filesystem::path& path)
    {
        // stem() 은 마지막 확장자 하나만 제거한다
        return path.filename().stem().string();
    }

} // namespace secret_reconciler
