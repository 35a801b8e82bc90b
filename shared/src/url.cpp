#include "skiff/url.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "skiff/errors.hpp"

namespace skiff
{

    namespace
    {

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        std::string to_lower(std::string_view text)
        {
            std::string result(text);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::uint16_t parse_port(std::string_view text)
        {
            unsigned int value = 0;
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (text.empty() || ec != std::errc{} || ptr != last || value == 0 || value > 65535)
            {
                throw ProtocolError("invalid port '" + std::string(text) + "'");
            }
            return static_cast<std::uint16_t>(value);
        }

        std::string default_user(Scheme scheme)
        {
            if (scheme != Scheme::Sftp)
            {
                return "anonymous";
            }
            if (const char *user = std::getenv("USER"); user != nullptr && *user != '\0')
            {
                return user;
            }
            if (const char *user = std::getenv("LOGNAME"); user != nullptr && *user != '\0')
            {
                return user;
            }
            throw ProtocolError("sftp URL has no user name and none could be taken from the environment");
        }

        void apply_query(std::string_view query, ConnectionProfile &profile)
        {
            while (!query.empty())
            {
                const auto amp = query.find('&');
                const auto option = query.substr(0, amp);
                query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
                if (option.empty())
                {
                    continue;
                }
                const auto eq = option.find('=');
                const auto key = to_lower(option.substr(0, eq));
                const auto value = eq == std::string_view::npos ? std::string{} : to_lower(percent_decode(option.substr(eq + 1)));
                if (key == "tls")
                {
                    if (profile.scheme != Scheme::Ftps)
                    {
                        throw ProtocolError("option 'tls' only applies to ftps URLs");
                    }
                    if (value == "explicit")
                    {
                        profile.tls = TlsMode::Explicit;
                    }
                    else if (value == "implicit")
                    {
                        profile.tls = TlsMode::Implicit;
                    }
                    else
                    {
                        throw ProtocolError("invalid tls mode '" + value + "'");
                    }
                }
                else
                {
                    spdlog::warn("Ignoring unrecognized URL option '{}'", key);
                }
            }
        }

    } // namespace

    std::uint16_t default_port(Scheme scheme, TlsMode tls) noexcept
    {
        switch (scheme)
        {
        case Scheme::Ftp:
            return 21;
        case Scheme::Ftps:
            return tls == TlsMode::Explicit ? 21 : 990;
        case Scheme::Sftp:
            return 22;
        }
        return 0;
    }

    std::string percent_decode(std::string_view text)
    {
        std::string result;
        result.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%')
            {
                if (i + 2 >= text.size())
                {
                    throw ProtocolError("truncated percent escape in URL");
                }
                const int high = hex_value(text[i + 1]);
                const int low = hex_value(text[i + 2]);
                if (high < 0 || low < 0)
                {
                    throw ProtocolError("invalid percent escape in URL");
                }
                result.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            else
            {
                result.push_back(text[i]);
            }
        }
        return result;
    }

    ParsedUrl parse_connection_url(std::string_view url)
    {
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos)
        {
            throw ProtocolError("URL must start with scheme://");
        }
        const auto scheme_name = to_lower(url.substr(0, scheme_end));
        const auto scheme = scheme_from_string(scheme_name);
        if (!scheme)
        {
            throw ProtocolError("unsupported scheme '" + scheme_name + "'");
        }

        ParsedUrl parsed;
        auto &profile = parsed.profile;
        profile.scheme = *scheme;
        profile.tls = profile.scheme == Scheme::Ftps ? TlsMode::Implicit : TlsMode::None;

        auto rest = url.substr(scheme_end + 3);
        std::string_view query;
        if (const auto q = rest.find('?'); q != std::string_view::npos)
        {
            query = rest.substr(q + 1);
            rest = rest.substr(0, q);
        }

        std::string_view authority = rest;
        std::string_view path;
        if (const auto slash = rest.find('/'); slash != std::string_view::npos)
        {
            authority = rest.substr(0, slash);
            path = rest.substr(slash);
        }

        // Credentials may legally contain '@' when escaped, so split on the last one.
        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            const auto userinfo = authority.substr(0, at);
            authority = authority.substr(at + 1);
            const auto colon = userinfo.find(':');
            profile.username = percent_decode(userinfo.substr(0, colon));
            if (colon != std::string_view::npos)
            {
                parsed.password = percent_decode(userinfo.substr(colon + 1));
            }
        }

        std::string_view host = authority;
        std::string_view port;
        if (!authority.empty() && authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                throw ProtocolError("unterminated IPv6 address in URL");
            }
            host = authority.substr(1, close - 1);
            const auto after = authority.substr(close + 1);
            if (!after.empty())
            {
                if (after.front() != ':')
                {
                    throw ProtocolError("unexpected characters after IPv6 address");
                }
                port = after.substr(1);
            }
        }
        else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
        {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }

        profile.host = percent_decode(host);
        if (profile.host.empty())
        {
            throw ProtocolError("URL has no host");
        }

        apply_query(query, profile);

        profile.port = port.empty() ? default_port(profile.scheme, profile.tls) : parse_port(port);
        if (profile.username.empty())
        {
            profile.username = default_user(profile.scheme);
        }
        profile.initial_path = path.empty() ? std::string{"/"} : normalize_remote(percent_decode(path));

        profile.id = std::string(to_string(profile.scheme)) + "://" + profile.username + '@' + profile.host + ':' +
                     std::to_string(profile.port);
        profile.credential_id = profile.id;
        return parsed;
    }

} // namespace skiff
