#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "skiff/client/protocol_session.hpp"

namespace skiff::client
{

    class CredentialStore;

    // Outcome of looking the server's key up in known_hosts.
    enum class KnownHostStatus
    {
        Match,
        Mismatch,
        NotFound
    };

    enum class HostKeyDecision
    {
        Trusted,
        // Not yet known but accepted by the profile; add it to known_hosts.
        Remember
    };

    // Throws HostKeyMismatchError for a changed key and UnknownHostKeyError
    // for a new key whose fingerprint the profile has not accepted.
    HostKeyDecision decide_host_key(const ConnectionProfile &profile, KnownHostStatus status,
                                    const std::string &algorithm, const std::string &fingerprint);

    /**
     * SFTP over libssh2 in blocking mode. The TCP connection is opened with
     * asio (for the connect deadline) and handed to libssh2 by descriptor;
     * libssh2's session timeout bounds every later read and write.
     *
     * Host keys are trusted on first use: an unknown key fails with
     * UnknownHostKeyError unless its fingerprint was accepted in the profile's
     * trust policy, in which case it is stored in known_hosts.
     */
    class SftpSession final : public ProtocolSession
    {
    public:
        SftpSession(ConnectionProfile profile, SessionOptions options, const CredentialStore &credentials);
        ~SftpSession() override;

        bool supports_resume() const noexcept override { return true; }

    protected:
        void do_connect() override;
        Listing do_list(const std::string &path) override;
        TransferResult do_get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                              const TransferControl &control) override;
        TransferResult do_put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                              const TransferControl &control) override;
        void do_mkdir(const std::string &path) override;
        void do_remove(const std::string &path, EntryKind kind) override;
        void do_rename(const std::string &from, const std::string &to) override;
        std::optional<RemoteEntry> do_stat(const std::string &path) override;
        bool do_set_modified_time(const std::string &path, std::int64_t unix_time) override;
        void do_chmod(const std::string &path, std::uint32_t mode) override;
        void do_close() noexcept override;
        // Shuts the socket down, which costs the connection.
        void do_abort_transfer() noexcept override;

    private:
        void open_socket();
        void verify_host_key();
        void authenticate();
        bool authenticate_with_agent(const std::string &user);

        LIBSSH2_SFTP_HANDLE *open_handle(const std::string &path, unsigned long flags, long mode, int type);
        RemoteEntry entry_from_attributes(const std::string &path, const LIBSSH2_SFTP_ATTRIBUTES &attributes);
        std::filesystem::path known_hosts_path() const;

        [[noreturn]] void throw_last_error(const std::string &what) const;

        SessionOptions options_;
        const CredentialStore &credentials_;
        asio::io_context io_;
        asio::ip::tcp::socket socket_;
        LIBSSH2_SESSION *session_{nullptr};
        LIBSSH2_SFTP *sftp_{nullptr};
        // Socket descriptor while a get/put runs, -1 otherwise.
        std::atomic<int> transfer_fd_{-1};
    };

} // namespace skiff::client
