#include "skiff/error_codes.hpp"

#include <array>

namespace skiff
{

    namespace
    {
        struct ErrorKindDescription
        {
            ErrorKind kind;
            std::string_view description;
        };

        constexpr std::array<ErrorKindDescription, 7> kDescriptions{{
            {ErrorKind::Connection, "connection"},
            {ErrorKind::Authentication, "authentication"},
            {ErrorKind::Protocol, "protocol"},
            {ErrorKind::Transfer, "transfer"},
            {ErrorKind::FileSystem, "filesystem"},
            {ErrorKind::Conflict, "conflict"},
            {ErrorKind::Internal, "internal"},
        }};
    } // namespace

    std::string_view to_string(ErrorKind kind) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.kind == kind)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorKind> error_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.kind;
            }
        }
        return std::nullopt;
    }

} // namespace skiff
