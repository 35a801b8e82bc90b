/**
 * Skiff - Parsers for FTP directory listings: Unix "ls -l" and DOS/IIS style
 * LIST output, and RFC 3659 MLSD/MLST fact lines.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "skiff/types.hpp"

namespace skiff::client
{

    enum class ListingFormat : std::uint8_t
    {
        List,
        Mlsd
    };

    // `now` (unix seconds) resolves dates that omit the year. The returned
    // entry carries the name only; path is left to the caller.
    std::optional<RemoteEntry> parse_list_line(std::string_view line, std::int64_t now);

    std::optional<RemoteEntry> parse_mlsd_line(std::string_view line);

    // Unparseable lines are counted in skipped_lines, never fatal.
    Listing parse_listing(std::string_view text, const std::string &directory, ListingFormat format, std::int64_t now);

    // RFC 3659 time-val (YYYYMMDDHHMMSS[.sss], UTC) used by MDTM, MFMT and MLSD.
    std::optional<std::int64_t> parse_ftp_timestamp(std::string_view value);
    std::string format_ftp_timestamp(std::int64_t unix_time);

    // Unix "ls -l" rendering of an entry, readable back by parse_list_line.
    std::string format_list_line(const RemoteEntry &entry, std::int64_t now);

} // namespace skiff::client
