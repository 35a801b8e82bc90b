#include "skiff/types.hpp"

#include <array>
#include <vector>

namespace skiff
{

    namespace
    {

        template <typename Enum>
        struct Label
        {
            Enum value;
            std::string_view label;
        };

        constexpr std::array<Label<Scheme>, 3> kSchemeLabels{{
            {Scheme::Ftp, "ftp"},
            {Scheme::Ftps, "ftps"},
            {Scheme::Sftp, "sftp"},
        }};

        constexpr std::array<Label<TlsMode>, 3> kTlsLabels{{
            {TlsMode::None, "none"},
            {TlsMode::Explicit, "explicit"},
            {TlsMode::Implicit, "implicit"},
        }};

        constexpr std::array<Label<EntryKind>, 3> kEntryKindLabels{{
            {EntryKind::File, "file"},
            {EntryKind::Directory, "directory"},
            {EntryKind::Symlink, "symlink"},
        }};

        constexpr std::array<Label<Direction>, 2> kDirectionLabels{{
            {Direction::Upload, "upload"},
            {Direction::Download, "download"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view lookup_label(const std::array<Label<Enum>, N> &table, Enum value) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.value == value)
                {
                    return entry.label;
                }
            }
            return "unknown";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> lookup_value(const std::array<Label<Enum>, N> &table, std::string_view label) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.label == label)
                {
                    return entry.value;
                }
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Scheme scheme) noexcept
    {
        return lookup_label(kSchemeLabels, scheme);
    }

    std::optional<Scheme> scheme_from_string(std::string_view value) noexcept
    {
        return lookup_value(kSchemeLabels, value);
    }

    std::string_view to_string(TlsMode mode) noexcept
    {
        return lookup_label(kTlsLabels, mode);
    }

    std::string_view to_string(EntryKind kind) noexcept
    {
        return lookup_label(kEntryKindLabels, kind);
    }

    std::optional<EntryKind> entry_kind_from_string(std::string_view value) noexcept
    {
        return lookup_value(kEntryKindLabels, value);
    }

    std::string_view to_string(Direction direction) noexcept
    {
        return lookup_label(kDirectionLabels, direction);
    }

    std::optional<Direction> direction_from_string(std::string_view value) noexcept
    {
        return lookup_value(kDirectionLabels, value);
    }

    std::string display_url(const ConnectionProfile &profile)
    {
        std::string url(to_string(profile.scheme));
        url += "://";
        if (!profile.username.empty())
        {
            url += profile.username;
            url += '@';
        }
        if (profile.host.find(':') != std::string::npos)
        {
            url += '[' + profile.host + ']';
        }
        else
        {
            url += profile.host;
        }
        url += ':';
        url += std::to_string(profile.port);
        if (!profile.initial_path.empty() && profile.initial_path != "/")
        {
            if (profile.initial_path.front() != '/')
            {
                url += '/';
            }
            url += profile.initial_path;
        }
        if (profile.scheme == Scheme::Ftps && profile.tls == TlsMode::Explicit)
        {
            url += "?tls=explicit";
        }
        return url;
    }

    void to_json(nlohmann::json &json, const RemoteEntry &entry)
    {
        json = nlohmann::json{{"path", entry.path},
                              {"name", entry.name},
                              {"size", entry.size},
                              {"mtime", entry.modified_time},
                              {"kind", to_string(entry.kind)}};
        if (entry.permissions)
        {
            json["permissions"] = *entry.permissions;
        }
        if (entry.link_target)
        {
            json["target"] = *entry.link_target;
        }
    }

    void from_json(const nlohmann::json &json, RemoteEntry &entry)
    {
        entry.path = json.at("path").get<std::string>();
        entry.name = json.value("name", remote_basename(entry.path));
        entry.size = json.value("size", std::uint64_t{0});
        entry.modified_time = json.value("mtime", std::int64_t{0});
        entry.kind = entry_kind_from_string(json.value("kind", std::string{"file"})).value_or(EntryKind::File);
        if (json.contains("permissions"))
        {
            entry.permissions = json.at("permissions").get<std::uint32_t>();
        }
        else
        {
            entry.permissions.reset();
        }
        if (json.contains("target"))
        {
            entry.link_target = json.at("target").get<std::string>();
        }
        else
        {
            entry.link_target.reset();
        }
    }

    std::string join_remote(std::string_view base, std::string_view child)
    {
        if (child.empty())
        {
            return std::string(base);
        }
        if (child.front() == '/' || base.empty())
        {
            return std::string(child);
        }
        std::string result(base);
        if (result.back() != '/')
        {
            result.push_back('/');
        }
        result.append(child);
        return result;
    }

    std::string remote_parent(std::string_view path)
    {
        const auto normalized = normalize_remote(std::string(path));
        const auto pos = normalized.find_last_of('/');
        if (pos == std::string::npos)
        {
            return ".";
        }
        if (pos == 0)
        {
            return "/";
        }
        return normalized.substr(0, pos);
    }

    std::string remote_basename(std::string_view path)
    {
        while (path.size() > 1 && path.back() == '/')
        {
            path.remove_suffix(1);
        }
        const auto pos = path.find_last_of('/');
        if (pos == std::string_view::npos)
        {
            return std::string(path);
        }
        return std::string(path.substr(pos + 1));
    }

    std::string normalize_remote(std::string path)
    {
        if (path.empty())
        {
            return "/";
        }
        const bool absolute = path.front() == '/';
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (start <= path.size())
        {
            auto end = path.find('/', start);
            if (end == std::string::npos)
            {
                end = path.size();
            }
            std::string part = path.substr(start, end - start);
            if (part == "..")
            {
                if (!parts.empty() && parts.back() != "..")
                {
                    parts.pop_back();
                }
                else if (!absolute)
                {
                    parts.push_back(part);
                }
            }
            else if (!part.empty() && part != ".")
            {
                parts.push_back(std::move(part));
            }
            start = end + 1;
        }

        std::string result = absolute ? "/" : "";
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0)
            {
                result.push_back('/');
            }
            result += parts[i];
        }
        if (result.empty())
        {
            return ".";
        }
        return result;
    }

} // namespace skiff
