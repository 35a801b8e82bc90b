#include "skiff/client/credentials.hpp"

#include "skiff/crypto.hpp"

namespace skiff::client
{

    Secret::~Secret()
    {
        wipe();
    }

    void Secret::wipe() noexcept
    {
        crypto::secure_wipe(password);
        crypto::secure_wipe(passphrase);
    }

    void StaticCredentialStore::put(const std::string &credential_id, Secret secret)
    {
        std::lock_guard lock(mutex_);
        secrets_.insert_or_assign(credential_id, std::move(secret));
    }

    void StaticCredentialStore::erase(const std::string &credential_id)
    {
        std::lock_guard lock(mutex_);
        secrets_.erase(credential_id);
    }

    std::optional<Secret> StaticCredentialStore::resolve(const std::string &credential_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = secrets_.find(credential_id);
        if (it == secrets_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

} // namespace skiff::client
