/**
 * Skiff - Connection URL grammar:
 *   scheme://[user[:password]@]host[:port][/initial-path][?query]
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "skiff/types.hpp"

namespace skiff
{

    struct ParsedUrl
    {
        ConnectionProfile profile;
        // Present only when the URL embedded one; callers hand it to a credential store.
        std::optional<std::string> password;
    };

    // Throws ProtocolError on an unknown scheme, a missing host, a bad port or
    // an option that does not apply to the scheme. Never touches the network.
    ParsedUrl parse_connection_url(std::string_view url);

    std::uint16_t default_port(Scheme scheme, TlsMode tls) noexcept;

    std::string percent_decode(std::string_view text);

} // namespace skiff
