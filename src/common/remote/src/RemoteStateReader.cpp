// src/common/remote/src/RemoteStateReader.cpp
#include "common/remote/include/RemoteStateReader.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace secret_reconciler::remote
{
    RemoteSnapshot::RemoteSnapshot(const std::vector<RemoteSecret>& secrets)
    {
        for (const auto& secret : secrets) {
            secrets_[secret.name] = secret;
        }
    }

    const RemoteSecret* RemoteSnapshot::Find(const std::string& name) const
    {
        auto it = secrets_.find(name);
        return it == secrets_.end() ? nullptr : &it->second;
    }

    RemoteStateReader::RemoteStateReader(std::shared_ptr<ISecretService> service)
        : service_(std::move(service))
    {
        if (!service_) {
            throw std::invalid_argument("RemoteStateReader requires a secret service");
        }
    }

    std::shared_ptr<const RemoteSnapshot> RemoteStateReader::ListSecrets(const std::string& project) const
    {
        auto snapshot = std::make_shared<const RemoteSnapshot>(service_->ListSecrets(project));
        LOG_INFOF("RemoteStateReader", "Remote snapshot holds %zu secret(s)", snapshot->Size());
        return snapshot;
    }

    PrincipalSet RemoteStateReader::GetAccessBindings(const std::string& name, const std::string& project) const
    {
        return service_->GetAccessBindings(name, project);
    }
}
