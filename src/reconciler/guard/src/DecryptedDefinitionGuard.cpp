// src/reconciler/guard/src/DecryptedDefinitionGuard.cpp
#include "reconciler/guard/include/DecryptedDefinitionGuard.hpp"
#include "common/utils/logger/Logger.hpp"

namespace secret_reconciler::reconciler
{
    DecryptedDefinitionGuard::DecryptedDefinitionGuard(const storage::SecretFileStore& store,
                                                       const crypto::EncryptionGate& gate,
                                                       const SecretDefinition& original)
        : store(store)
        , original(original)
        , plaintext(gate.Decrypt(original))
    {
        store.WritePayloadOnly(this->original.file_path, plaintext);
        staged = true;

        LOG_DEBUGF("DecryptedDefinitionGuard", "[%s] Staged %s payload for upload",
                   this->original.name.c_str(), this->original.IsEncrypted() ? "decrypted" : "plaintext");
    }

    DecryptedDefinitionGuard::~DecryptedDefinitionGuard()
    {
        if (staged) {
            Restore();
        }
    }

    bool DecryptedDefinitionGuard::Restore()
    {
        if (!staged) {
            return true;
        }

        try {
            store.WriteDefinition(original.file_path, original);
            staged = false;
            LOG_DEBUGF("DecryptedDefinitionGuard", "[%s] Restored %s definition file",
                       original.name.c_str(), ToString(original.metadata.status));
            return true;
        } catch (const std::exception& e) {
            LOG_ERRORF("DecryptedDefinitionGuard", "[%s] ✗ Failed to restore %s: %s",
                       original.name.c_str(), original.file_path.string().c_str(), e.what());
            return false;
        }
    }
}
