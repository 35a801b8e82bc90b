/**
 * Skiff - Error taxonomy shared by the session, transfer and sync layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace skiff
{

    enum class ErrorKind : std::uint8_t
    {
        Connection = 0,
        Authentication = 1,
        Protocol = 2,
        Transfer = 3,
        FileSystem = 4,
        Conflict = 5,
        Internal = 6
    };

    std::string_view to_string(ErrorKind kind) noexcept;

    std::optional<ErrorKind> error_kind_from_string(std::string_view value) noexcept;

    // Only transient network and I/O failures are retried automatically.
    constexpr bool is_retryable(ErrorKind kind) noexcept
    {
        return kind == ErrorKind::Connection || kind == ErrorKind::Transfer;
    }

} // namespace skiff
