#include "skiff/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

#include "skiff/encoding/base64.hpp"

namespace skiff::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    void secure_wipe(std::string &secret) noexcept
    {
        if (!secret.empty())
        {
            sodium_memzero(secret.data(), secret.size());
        }
        secret.clear();
        secret.shrink_to_fit();
    }

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        if (lhs.empty())
        {
            return true;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

    std::string sha256_fingerprint(std::span<const std::byte> key)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(key.data()), key.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        auto encoded = encoding::encode_base64(std::as_bytes(std::span<const unsigned char>(digest)));
        while (!encoded.empty() && encoded.back() == '=')
        {
            encoded.pop_back();
        }
        return "SHA256:" + encoded;
    }

} // namespace skiff::crypto
