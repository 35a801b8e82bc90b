/**
 * Skiff - Connection profile and remote entry types shared by every layer.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace skiff
{

    enum class Scheme : std::uint8_t
    {
        Ftp,
        Ftps,
        Sftp
    };

    std::string_view to_string(Scheme scheme) noexcept;
    std::optional<Scheme> scheme_from_string(std::string_view value) noexcept;

    enum class TlsMode : std::uint8_t
    {
        None,
        Explicit,
        Implicit
    };

    std::string_view to_string(TlsMode mode) noexcept;

    enum class EntryKind : std::uint8_t
    {
        File,
        Directory,
        Symlink
    };

    std::string_view to_string(EntryKind kind) noexcept;
    std::optional<EntryKind> entry_kind_from_string(std::string_view value) noexcept;

    struct TrustPolicy
    {
        // FTPS: validate the server certificate chain against the system store.
        bool verify_certificate{true};
        // SFTP: a previously unknown host key with this fingerprint is accepted and remembered.
        std::optional<std::string> accepted_host_key{};
        std::optional<std::filesystem::path> known_hosts_path{};
    };

    /**
     * Everything needed to open a session except the secret, which is fetched
     * from the credential store by credential_id on every connect attempt.
     */
    struct ConnectionProfile
    {
        std::string id;
        Scheme scheme{Scheme::Ftp};
        TlsMode tls{TlsMode::None};
        std::string host;
        std::uint16_t port{};
        std::string username;
        std::string credential_id;
        std::string initial_path{"/"};
        TrustPolicy trust{};
        bool passive{true};
    };

    std::string display_url(const ConnectionProfile &profile);

    struct RemoteEntry
    {
        std::string path;
        std::string name;
        std::uint64_t size{};
        // Unix seconds (UTC); 0 when the server did not report a time.
        std::int64_t modified_time{};
        EntryKind kind{EntryKind::File};
        std::optional<std::uint32_t> permissions{};
        std::optional<std::string> link_target{};

        bool is_directory() const noexcept { return kind == EntryKind::Directory; }

        bool operator==(const RemoteEntry &) const = default;
    };

    void to_json(nlohmann::json &json, const RemoteEntry &entry);
    void from_json(const nlohmann::json &json, RemoteEntry &entry);

    struct Listing
    {
        std::vector<RemoteEntry> entries;
        // Lines of a textual listing that could not be parsed.
        std::size_t skipped_lines{};
    };

    using TaskId = std::uint64_t;

    enum class Direction : std::uint8_t
    {
        Upload,
        Download
    };

    std::string_view to_string(Direction direction) noexcept;
    std::optional<Direction> direction_from_string(std::string_view value) noexcept;

    // Remote paths always use '/' separators.
    std::string join_remote(std::string_view base, std::string_view child);
    std::string remote_parent(std::string_view path);
    std::string remote_basename(std::string_view path);
    std::string normalize_remote(std::string path);

} // namespace skiff
