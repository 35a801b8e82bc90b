#include "skiff/client/sftp_session.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include <sys/socket.h>

#include <asio/connect.hpp>

#include <spdlog/spdlog.h>

#include "skiff/client/config.hpp"
#include "skiff/client/credentials.hpp"
#include "skiff/crypto.hpp"
#include "skiff/errors.hpp"

namespace skiff::client
{

    namespace
    {

        using asio::ip::tcp;

        constexpr long kDefaultFileMode = 0644;
        constexpr long kDefaultDirectoryMode = 0755;

        std::once_flag libssh2_once;

        void ensure_libssh2_init()
        {
            int rc = 0;
            std::call_once(libssh2_once, [&]
                           { rc = libssh2_init(0); });
            if (rc != 0)
            {
                throw ProtocolError("libssh2 initialisation failed");
            }
        }

        struct HandleCloser
        {
            void operator()(LIBSSH2_SFTP_HANDLE *handle) const noexcept { libssh2_sftp_close_handle(handle); }
        };
        using HandlePtr = std::unique_ptr<LIBSSH2_SFTP_HANDLE, HandleCloser>;

        // Exposes the socket to abort requests for the duration of one transfer.
        struct TransferSocket
        {
            TransferSocket(std::atomic<int> &target, int fd) : slot(target) { slot = fd; }
            ~TransferSocket() { slot = -1; }

            std::atomic<int> &slot;
        };

        struct KnownHostsDeleter
        {
            void operator()(LIBSSH2_KNOWNHOSTS *hosts) const noexcept { libssh2_knownhost_free(hosts); }
        };

        struct AgentDeleter
        {
            void operator()(LIBSSH2_AGENT *agent) const noexcept
            {
                libssh2_agent_disconnect(agent);
                libssh2_agent_free(agent);
            }
        };

        const char *host_key_algorithm(int type)
        {
            switch (type)
            {
            case LIBSSH2_HOSTKEY_TYPE_RSA:
                return "ssh-rsa";
            case LIBSSH2_HOSTKEY_TYPE_DSS:
                return "ssh-dss";
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
                return "ecdsa-sha2-nistp256";
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
                return "ecdsa-sha2-nistp384";
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
                return "ecdsa-sha2-nistp521";
            case LIBSSH2_HOSTKEY_TYPE_ED25519:
                return "ssh-ed25519";
            default:
                return "unknown";
            }
        }

        int known_host_key_mask(int type)
        {
            switch (type)
            {
            case LIBSSH2_HOSTKEY_TYPE_RSA:
                return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
            case LIBSSH2_HOSTKEY_TYPE_DSS:
                return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
                return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
                return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
            case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
                return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
            case LIBSSH2_HOSTKEY_TYPE_ED25519:
                return LIBSSH2_KNOWNHOST_KEY_ED25519;
            default:
                return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
            }
        }

        // known_hosts spells non-default ports as "[host]:port".
        std::string known_hosts_name(const std::string &host, std::uint16_t port)
        {
            if (port == 22)
            {
                return host;
            }
            return "[" + host + "]:" + std::to_string(port);
        }

        bool is_connection_failure(int code)
        {
            switch (code)
            {
            case LIBSSH2_ERROR_SOCKET_NONE:
            case LIBSSH2_ERROR_BANNER_RECV:
            case LIBSSH2_ERROR_BANNER_SEND:
            case LIBSSH2_ERROR_SOCKET_SEND:
            case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            case LIBSSH2_ERROR_SOCKET_DISCONNECT:
            case LIBSSH2_ERROR_SOCKET_RECV:
            case LIBSSH2_ERROR_TIMEOUT:
                return true;
            default:
                return false;
            }
        }

        std::string sftp_status_text(unsigned long status)
        {
            switch (status)
            {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return "does not exist";
            case LIBSSH2_FX_PERMISSION_DENIED:
                return "permission denied";
            case LIBSSH2_FX_FILE_ALREADY_EXISTS:
                return "already exists";
            case LIBSSH2_FX_DIR_NOT_EMPTY:
                return "directory not empty";
            case LIBSSH2_FX_NOT_A_DIRECTORY:
                return "not a directory";
            case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
            case LIBSSH2_FX_QUOTA_EXCEEDED:
                return "no space left";
            case LIBSSH2_FX_OP_UNSUPPORTED:
                return "operation not supported";
            case LIBSSH2_FX_CONNECTION_LOST:
            case LIBSSH2_FX_NO_CONNECTION:
                return "connection lost";
            default:
                return "status " + std::to_string(status);
            }
        }

        // Answers every keyboard-interactive prompt with the password stored in the session abstract.
        LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(answer_with_password)
        {
            (void)name;
            (void)name_len;
            (void)instruction;
            (void)instruction_len;
            (void)prompts;
            const auto *password = static_cast<const std::string *>(*abstract);
            for (int i = 0; i < num_prompts; ++i)
            {
                responses[i].text = nullptr;
                responses[i].length = 0;
                if (!password)
                {
                    continue;
                }
                auto *copy = static_cast<char *>(std::malloc(password->size() + 1));
                if (!copy)
                {
                    continue;
                }
                std::memcpy(copy, password->c_str(), password->size() + 1);
                responses[i].text = copy;
                responses[i].length = static_cast<unsigned int>(password->size());
            }
        }

    } // namespace

    SftpSession::SftpSession(ConnectionProfile profile, SessionOptions options, const CredentialStore &credentials)
        : ProtocolSession(std::move(profile)), options_(std::move(options)), credentials_(credentials), socket_(io_)
    {
    }

    SftpSession::~SftpSession()
    {
        close();
    }

    void SftpSession::do_connect()
    {
        ensure_libssh2_init();
        open_socket();

        session_ = libssh2_session_init();
        if (!session_)
        {
            throw ProtocolError("cannot allocate SSH session");
        }
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_set_timeout(session_, static_cast<long>(options_.io_timeout.count()));

        if (libssh2_session_handshake(session_, static_cast<libssh2_socket_t>(socket_.native_handle())) != 0)
        {
            throw_last_error("SSH handshake with " + profile().host);
        }

        verify_host_key();
        authenticate();

        sftp_ = libssh2_sftp_init(session_);
        if (!sftp_)
        {
            throw_last_error("SFTP subsystem");
        }
    }

    void SftpSession::open_socket()
    {
        const auto &host = profile().host;
        const auto port = profile().port;

        tcp::resolver resolver(io_);
        std::error_code error;
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(host, std::to_string(port),
                               [&](const std::error_code &ec, tcp::resolver::results_type results)
                               {
                                   error = ec;
                                   endpoints = std::move(results);
                               });
        io_.restart();
        io_.run_for(options_.connect_timeout);
        if (!io_.stopped())
        {
            resolver.cancel();
            io_.run();
            throw ConnectionError("name resolution of " + host + " timed out");
        }
        if (error)
        {
            throw ConnectionError("cannot resolve " + host + ": " + error.message());
        }

        asio::async_connect(socket_, endpoints, [&](const std::error_code &ec, const tcp::endpoint &)
                            { error = ec; });
        io_.restart();
        io_.run_for(options_.connect_timeout);
        if (!io_.stopped())
        {
            std::error_code ignored;
            socket_.close(ignored);
            io_.run();
            throw ConnectionError("connect to " + host + ':' + std::to_string(port) + " timed out after " +
                                  std::to_string(options_.connect_timeout.count()) + " ms");
        }
        if (error)
        {
            throw ConnectionError("cannot connect to " + host + ':' + std::to_string(port) + ": " + error.message());
        }
    }

    HostKeyDecision decide_host_key(const ConnectionProfile &profile, KnownHostStatus status,
                                    const std::string &algorithm, const std::string &fingerprint)
    {
        switch (status)
        {
        case KnownHostStatus::Match:
            return HostKeyDecision::Trusted;
        case KnownHostStatus::Mismatch:
            throw HostKeyMismatchError(profile.host, profile.port);
        case KnownHostStatus::NotFound:
            break;
        }
        const auto &accepted = profile.trust.accepted_host_key;
        if (!accepted || !crypto::constant_time_equals(*accepted, fingerprint))
        {
            throw UnknownHostKeyError(profile.host, profile.port, algorithm, fingerprint);
        }
        return HostKeyDecision::Remember;
    }

    void SftpSession::verify_host_key()
    {
        const auto &host = profile().host;
        const auto port = profile().port;

        std::size_t key_length = 0;
        int key_type = 0;
        const char *key = libssh2_session_hostkey(session_, &key_length, &key_type);
        if (!key || key_length == 0)
        {
            throw ProtocolError("server " + host + " sent no host key");
        }
        const auto fingerprint =
            crypto::sha256_fingerprint(std::as_bytes(std::span<const char>(key, key_length)));
        const std::string algorithm = host_key_algorithm(key_type);

        std::unique_ptr<LIBSSH2_KNOWNHOSTS, KnownHostsDeleter> hosts(libssh2_knownhost_init(session_));
        if (!hosts)
        {
            throw ProtocolError("cannot initialise known hosts");
        }
        const auto path = known_hosts_path();
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            if (libssh2_knownhost_readfile(hosts.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0)
            {
                spdlog::warn("Could not read known hosts file {}", path.string());
            }
        }

        const int mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | known_host_key_mask(key_type);
        libssh2_knownhost *match = nullptr;
        KnownHostStatus status = KnownHostStatus::NotFound;
        switch (libssh2_knownhost_checkp(hosts.get(), host.c_str(), port, key, key_length, mask, &match))
        {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            status = KnownHostStatus::Match;
            break;
        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            status = KnownHostStatus::Mismatch;
            break;
        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
            break;
        default:
            throw ProtocolError("host key check for " + host + " failed");
        }
        if (decide_host_key(profile(), status, algorithm, fingerprint) == HostKeyDecision::Trusted)
        {
            spdlog::debug("Host key for {} matches {}", host, path.string());
            return;
        }

        const auto entry = known_hosts_name(host, port);
        if (libssh2_knownhost_addc(hosts.get(), entry.c_str(), nullptr, key, key_length, nullptr, 0, mask, nullptr) != 0)
        {
            spdlog::warn("Could not record host key for {}", entry);
            return;
        }
        std::filesystem::create_directories(path.parent_path(), ec);
        if (libssh2_knownhost_writefile(hosts.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0)
        {
            spdlog::warn("Could not write known hosts file {}", path.string());
            return;
        }
        spdlog::info("Added {} key {} for {} to {}", algorithm, fingerprint, entry, path.string());
    }

    void SftpSession::authenticate()
    {
        const auto &user = profile().username;
        const auto user_length = static_cast<unsigned int>(user.size());
        auto secret = credentials_.resolve(profile().credential_id);

        if (secret && secret->private_key)
        {
            const auto key = secret->private_key->string();
            const char *passphrase = secret->passphrase.empty() ? nullptr : secret->passphrase.c_str();
            if (libssh2_userauth_publickey_fromfile_ex(session_, user.c_str(), user_length, nullptr, key.c_str(),
                                                       passphrase) == 0)
            {
                spdlog::debug("Authenticated {} with key {}", user, key);
                return;
            }
            if (is_connection_failure(libssh2_session_last_errno(session_)))
            {
                throw_last_error("public key authentication");
            }
            spdlog::debug("Key {} rejected for {}", key, user);
        }

        if (secret && !secret->password.empty())
        {
            if (libssh2_userauth_password_ex(session_, user.c_str(), user_length, secret->password.c_str(),
                                             static_cast<unsigned int>(secret->password.size()), nullptr) == 0)
            {
                return;
            }
            if (is_connection_failure(libssh2_session_last_errno(session_)))
            {
                throw_last_error("password authentication");
            }

            const char *methods = libssh2_userauth_list(session_, user.c_str(), user_length);
            if (methods && std::strstr(methods, "keyboard-interactive"))
            {
                void **abstract = libssh2_session_abstract(session_);
                *abstract = &secret->password;
                const int rc =
                    libssh2_userauth_keyboard_interactive_ex(session_, user.c_str(), user_length, answer_with_password);
                *abstract = nullptr;
                if (rc == 0)
                {
                    return;
                }
            }
            throw AuthenticationError("authentication as " + user + " rejected by " + profile().host);
        }

        if (authenticate_with_agent(user))
        {
            return;
        }
        throw AuthenticationError("no accepted credentials for " + user + '@' + profile().host);
    }

    bool SftpSession::authenticate_with_agent(const std::string &user)
    {
        std::unique_ptr<LIBSSH2_AGENT, AgentDeleter> agent(libssh2_agent_init(session_));
        if (!agent || libssh2_agent_connect(agent.get()) != 0)
        {
            spdlog::debug("No SSH agent available");
            return false;
        }
        if (libssh2_agent_list_identities(agent.get()) != 0)
        {
            return false;
        }
        libssh2_agent_publickey *identity = nullptr;
        libssh2_agent_publickey *previous = nullptr;
        while (libssh2_agent_get_identity(agent.get(), &identity, previous) == 0)
        {
            if (libssh2_agent_userauth(agent.get(), user.c_str(), identity) == 0)
            {
                spdlog::debug("Authenticated {} via agent key {}", user, identity->comment ? identity->comment : "");
                return true;
            }
            previous = identity;
        }
        return false;
    }

    std::filesystem::path SftpSession::known_hosts_path() const
    {
        if (profile().trust.known_hosts_path)
        {
            return *profile().trust.known_hosts_path;
        }
        if (!options_.known_hosts.empty())
        {
            return options_.known_hosts;
        }
        return default_known_hosts_path();
    }

    void SftpSession::throw_last_error(const std::string &what) const
    {
        char *message = nullptr;
        int length = 0;
        const int code = session_ ? libssh2_session_last_error(session_, &message, &length, 0) : 0;
        std::string detail = message && length > 0 ? std::string(message, static_cast<std::size_t>(length))
                                                   : std::string("error ") + std::to_string(code);

        if (code == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_)
        {
            const auto status = libssh2_sftp_last_error(sftp_);
            if (status == LIBSSH2_FX_CONNECTION_LOST || status == LIBSSH2_FX_NO_CONNECTION)
            {
                throw ConnectionError(what + ": " + sftp_status_text(status));
            }
            throw ProtocolError(what + ": " + sftp_status_text(status));
        }
        if (is_connection_failure(code))
        {
            throw ConnectionError(what + ": " + detail);
        }
        if (code == LIBSSH2_ERROR_AUTHENTICATION_FAILED || code == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED)
        {
            throw AuthenticationError(what + ": " + detail);
        }
        throw ProtocolError(what + ": " + detail);
    }

    LIBSSH2_SFTP_HANDLE *SftpSession::open_handle(const std::string &path, unsigned long flags, long mode, int type)
    {
        auto *handle = libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), flags, mode,
                                            type);
        if (!handle)
        {
            throw_last_error("open " + path);
        }
        return handle;
    }

    RemoteEntry SftpSession::entry_from_attributes(const std::string &path, const LIBSSH2_SFTP_ATTRIBUTES &attributes)
    {
        RemoteEntry entry;
        entry.path = path;
        entry.name = remote_basename(path);
        entry.kind = EntryKind::File;
        if (attributes.flags & LIBSSH2_SFTP_ATTR_SIZE)
        {
            entry.size = attributes.filesize;
        }
        if (attributes.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        {
            entry.modified_time = static_cast<std::int64_t>(attributes.mtime);
        }
        if (attributes.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
        {
            const auto type = attributes.permissions & LIBSSH2_SFTP_S_IFMT;
            if (type == LIBSSH2_SFTP_S_IFDIR)
            {
                entry.kind = EntryKind::Directory;
                entry.size = 0;
            }
            else if (type == LIBSSH2_SFTP_S_IFLNK)
            {
                entry.kind = EntryKind::Symlink;
            }
            entry.permissions = static_cast<std::uint32_t>(attributes.permissions & 07777);
        }

        if (entry.kind == EntryKind::Symlink)
        {
            std::array<char, 4096> target{};
            const int n = libssh2_sftp_symlink_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                                  target.data(), static_cast<unsigned int>(target.size()),
                                                  LIBSSH2_SFTP_READLINK);
            if (n > 0)
            {
                entry.link_target = std::string(target.data(), static_cast<std::size_t>(n));
            }
        }
        return entry;
    }

    Listing SftpSession::do_list(const std::string &path)
    {
        HandlePtr directory(open_handle(path, 0, 0, LIBSSH2_SFTP_OPENDIR));
        Listing listing;
        std::array<char, 4096> name{};
        while (true)
        {
            LIBSSH2_SFTP_ATTRIBUTES attributes{};
            const int rc = libssh2_sftp_readdir_ex(directory.get(), name.data(), name.size(), nullptr, 0, &attributes);
            if (rc == 0)
            {
                break;
            }
            if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL)
            {
                ++listing.skipped_lines;
                continue;
            }
            if (rc < 0)
            {
                throw_last_error("list " + path);
            }
            const std::string entry_name(name.data(), static_cast<std::size_t>(rc));
            if (entry_name == "." || entry_name == "..")
            {
                continue;
            }
            listing.entries.push_back(entry_from_attributes(join_remote(path, entry_name), attributes));
        }
        return listing;
    }

    TransferResult SftpSession::do_get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                                       const TransferControl &control)
    {
        HandlePtr file(open_handle(remote_path, LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE));
        if (offset > 0)
        {
            libssh2_sftp_seek64(file.get(), offset);
        }
        TransferSocket active(transfer_fd_, socket_.native_handle());

        TransferResult result{0, offset, false};
        std::vector<char> buffer(options_.chunk_size);
        while (true)
        {
            if (control.stop_requested())
            {
                sink.flush();
                return result;
            }
            const auto n = libssh2_sftp_read(file.get(), buffer.data(), buffer.size());
            if (n == 0)
            {
                break;
            }
            if (n < 0)
            {
                throw_last_error("read " + remote_path);
            }
            sink.write(buffer.data(), n);
            if (!sink)
            {
                throw FileSystemError("cannot write local data for " + remote_path);
            }
            result.bytes_transferred += static_cast<std::uint64_t>(n);
            result.final_offset += static_cast<std::uint64_t>(n);
            control.report(result.final_offset);
        }
        sink.flush();
        result.completed = true;
        return result;
    }

    TransferResult SftpSession::do_put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                                       const TransferControl &control)
    {
        unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
        if (offset == 0)
        {
            flags |= LIBSSH2_FXF_TRUNC;
        }
        HandlePtr file(open_handle(remote_path, flags, kDefaultFileMode, LIBSSH2_SFTP_OPENFILE));
        if (offset > 0)
        {
            libssh2_sftp_seek64(file.get(), offset);
        }
        TransferSocket active(transfer_fd_, socket_.native_handle());

        TransferResult result{0, offset, false};
        std::vector<char> buffer(options_.chunk_size);
        while (true)
        {
            if (control.stop_requested())
            {
                return result;
            }
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(source.gcount());
            if (count == 0)
            {
                if (source.bad())
                {
                    throw FileSystemError("cannot read local data for " + remote_path);
                }
                break;
            }
            std::size_t written = 0;
            while (written < count)
            {
                const auto n = libssh2_sftp_write(file.get(), buffer.data() + written, count - written);
                if (n < 0)
                {
                    throw_last_error("write " + remote_path);
                }
                written += static_cast<std::size_t>(n);
            }
            result.bytes_transferred += count;
            result.final_offset += count;
            control.report(result.final_offset);
        }
        result.completed = true;
        return result;
    }

    void SftpSession::do_mkdir(const std::string &path)
    {
        if (libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), kDefaultDirectoryMode) !=
            0)
        {
            throw_last_error("mkdir " + path);
        }
    }

    void SftpSession::do_remove(const std::string &path, EntryKind kind)
    {
        const auto length = static_cast<unsigned int>(path.size());
        const int rc = kind == EntryKind::Directory ? libssh2_sftp_rmdir_ex(sftp_, path.c_str(), length)
                                                    : libssh2_sftp_unlink_ex(sftp_, path.c_str(), length);
        if (rc != 0)
        {
            throw_last_error("remove " + path);
        }
    }

    void SftpSession::do_rename(const std::string &from, const std::string &to)
    {
        const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
        if (libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned int>(from.size()), to.c_str(),
                                   static_cast<unsigned int>(to.size()), flags) != 0)
        {
            throw_last_error("rename " + from + " to " + to);
        }
    }

    std::optional<RemoteEntry> SftpSession::do_stat(const std::string &path)
    {
        LIBSSH2_SFTP_ATTRIBUTES attributes{};
        if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_LSTAT,
                                 &attributes) != 0)
        {
            if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL)
            {
                const auto status = libssh2_sftp_last_error(sftp_);
                if (status == LIBSSH2_FX_NO_SUCH_FILE || status == LIBSSH2_FX_NO_SUCH_PATH)
                {
                    return std::nullopt;
                }
            }
            throw_last_error("stat " + path);
        }
        return entry_from_attributes(path, attributes);
    }

    bool SftpSession::do_set_modified_time(const std::string &path, std::int64_t unix_time)
    {
        LIBSSH2_SFTP_ATTRIBUTES attributes{};
        attributes.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
        attributes.atime = static_cast<unsigned long>(unix_time);
        attributes.mtime = static_cast<unsigned long>(unix_time);
        if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_SETSTAT,
                                 &attributes) != 0)
        {
            throw_last_error("set time of " + path);
        }
        return true;
    }

    void SftpSession::do_chmod(const std::string &path, std::uint32_t mode)
    {
        LIBSSH2_SFTP_ATTRIBUTES attributes{};
        attributes.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attributes.permissions = mode & 07777;
        if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_SETSTAT,
                                 &attributes) != 0)
        {
            throw_last_error("chmod " + path);
        }
    }

    void SftpSession::do_abort_transfer() noexcept
    {
        const int fd = transfer_fd_.load();
        if (fd < 0)
        {
            return;
        }
        // The blocked libssh2 call fails with a socket error and the session is dropped.
        if (::shutdown(fd, SHUT_RDWR) != 0)
        {
            spdlog::debug("Cannot interrupt transfer on {}: {}", profile().host, std::strerror(errno));
        }
    }

    void SftpSession::do_close() noexcept
    {
        if (sftp_)
        {
            libssh2_sftp_shutdown(sftp_);
            sftp_ = nullptr;
        }
        if (session_)
        {
            libssh2_session_disconnect(session_, "Normal Shutdown");
            libssh2_session_free(session_);
            session_ = nullptr;
        }
        std::error_code ignored;
        socket_.close(ignored);
    }

} // namespace skiff::client
