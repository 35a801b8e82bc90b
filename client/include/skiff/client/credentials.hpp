#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace skiff::client
{

    struct Secret
    {
        std::string password;
        std::optional<std::filesystem::path> private_key{};
        std::string passphrase{};

        Secret() = default;
        explicit Secret(std::string password_value) : password(std::move(password_value)) {}
        Secret(const Secret &) = default;
        Secret(Secret &&) noexcept = default;
        Secret &operator=(const Secret &) = default;
        Secret &operator=(Secret &&) noexcept = default;
        ~Secret();

        void wipe() noexcept;
    };

    /**
     * Retrieval contract of the external credential backend. Sessions resolve
     * the secret once per connect attempt and wipe their copy afterwards.
     */
    class CredentialStore
    {
    public:
        virtual ~CredentialStore() = default;

        virtual std::optional<Secret> resolve(const std::string &credential_id) const = 0;
    };

    // In-memory store fed by the command line.
    class StaticCredentialStore : public CredentialStore
    {
    public:
        void put(const std::string &credential_id, Secret secret);
        void erase(const std::string &credential_id);

        std::optional<Secret> resolve(const std::string &credential_id) const override;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, Secret> secrets_;
    };

} // namespace skiff::client
