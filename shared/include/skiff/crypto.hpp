/**
 * Skiff - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace skiff::crypto
{

    void ensure_sodium_init();

    // Overwrites the buffer before clearing it so secrets do not linger in freed memory.
    void secure_wipe(std::string &secret) noexcept;

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept;

    // OpenSSH style "SHA256:<unpadded base64>" fingerprint of a raw host key blob.
    std::string sha256_fingerprint(std::span<const std::byte> key);

} // namespace skiff::crypto
