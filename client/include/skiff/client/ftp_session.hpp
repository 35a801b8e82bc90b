#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/streambuf.hpp>

#include "skiff/client/protocol_session.hpp"

namespace skiff::client
{

    class CredentialStore;

    // Capabilities advertised in the FEAT reply.
    struct FtpFeatures
    {
        bool mlsd{};
        bool mlst{};
        bool rest_stream{};
        bool mfmt{};
        bool mdtm{};
        bool size{};
        bool utf8{};
        bool epsv{true};
    };

    /**
     * FTP and FTPS (explicit AUTH TLS or implicit TLS) over asio. All socket
     * operations are asynchronous ops driven by a private io_context with a
     * deadline, so every read, write and connect honours the configured timeouts.
     */
    class FtpSession final : public ProtocolSession
    {
    public:
        FtpSession(ConnectionProfile profile, SessionOptions options, const CredentialStore &credentials);
        ~FtpSession() override;

        bool supports_resume() const noexcept override { return features_.rest_stream; }

        const FtpFeatures &features() const noexcept { return features_; }

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
        void do_abort_transfer() noexcept override;

    private:
        using tcp = asio::ip::tcp;
        using TlsStream = asio::ssl::stream<tcp::socket>;

        struct Reply
        {
            int code{};
            std::vector<std::string> lines;

            const std::string &last() const { return lines.back(); }
            int family() const noexcept { return code / 100; }
        };

        // A socket that may have been upgraded to TLS.
        struct Channel
        {
            std::unique_ptr<TlsStream> stream;
            bool secure{false};

            tcp::socket &socket() { return stream->next_layer(); }
            bool is_open() const { return stream && stream->next_layer().is_open(); }
        };

        struct DataConnection
        {
            Channel channel;
            std::unique_ptr<tcp::acceptor> acceptor;
        };

        // Publishes the data channel to do_abort_transfer() for one get/put.
        class ActiveData
        {
        public:
            ActiveData(FtpSession &session, Channel &channel);
            ~ActiveData();

            ActiveData(const ActiveData &) = delete;
            ActiveData &operator=(const ActiveData &) = delete;

        private:
            FtpSession &session_;
        };

        // Runs queued async work; on deadline `cancel` closes the socket involved
        // and a ConnectionError is raised.
        void await(std::chrono::milliseconds timeout, const char *what, const std::function<void()> &cancel);
        void abort_sockets() noexcept;
        void drop_connection() noexcept;

        void connect_socket(tcp::socket &socket, const std::string &host, std::uint16_t port);
        void connect_socket(tcp::socket &socket, const tcp::endpoint &endpoint);
        void tls_handshake(Channel &channel, bool reuse_control_session);
        void tls_shutdown(Channel &channel) noexcept;

        std::string read_line(std::chrono::milliseconds timeout);
        Reply read_reply();
        Reply read_reply(std::chrono::milliseconds timeout);
        void send_command(const std::string &command);
        Reply command(const std::string &command);
        Reply expect(const std::string &command, int family);
        [[noreturn]] void throw_reply_error(const std::string &command, const Reply &reply) const;

        void login();
        void negotiate_features();

        DataConnection open_data_connection();
        DataConnection open_passive();
        DataConnection open_active();
        void begin_transfer(DataConnection &data, const std::string &command);
        std::size_t read_data(Channel &channel, char *buffer, std::size_t size, bool &eof);
        void write_data(Channel &channel, const char *buffer, std::size_t size);
        void finish_transfer(DataConnection &data, const std::string &command);
        void abort_transfer(DataConnection &data) noexcept;
        std::string fetch_text(const std::string &command);

        SessionOptions options_;
        const CredentialStore &credentials_;
        asio::io_context io_;
        asio::ssl::context tls_context_;
        Channel control_;
        asio::streambuf control_buffer_;
        FtpFeatures features_;
        bool logged_in_{false};
        bool data_protected_{false};
        // Data channel of the running get/put. Only touched on the io_ thread.
        Channel *active_data_{nullptr};
        std::atomic<std::uint64_t> transfer_serial_{0};
    };

} // namespace skiff::client
