#include "skiff/client/ftp_session.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <spdlog/spdlog.h>

#include "skiff/client/credentials.hpp"
#include "skiff/client/ftp_listing.hpp"
#include "skiff/crypto.hpp"
#include "skiff/errors.hpp"
#include "skiff/logging.hpp"

namespace skiff::client
{

    namespace
    {

        constexpr auto kAnonymousPassword = "anonymous@";
        constexpr std::chrono::milliseconds kShutdownTimeout{5000};

        class WipeOnExit
        {
        public:
            explicit WipeOnExit(std::string &secret) : secret_(secret) {}
            ~WipeOnExit() { crypto::secure_wipe(secret_); }

            WipeOnExit(const WipeOnExit &) = delete;
            WipeOnExit &operator=(const WipeOnExit &) = delete;

        private:
            std::string &secret_;
        };

        bool is_anonymous(const std::string &user)
        {
            return user == "anonymous" || user == "ftp";
        }

        std::string upper(std::string_view text)
        {
            std::string result(text);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        // "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)". The host part is
        // ignored: the control peer is used so a server cannot point us elsewhere.
        std::optional<std::uint16_t> parse_pasv_port(const std::string &reply)
        {
            if (reply.size() <= 4)
            {
                return std::nullopt;
            }
            const auto start = reply.find_first_of("0123456789", 4);
            if (start == std::string::npos)
            {
                return std::nullopt;
            }
            std::array<int, 6> fields{};
            if (std::sscanf(reply.c_str() + start, "%d,%d,%d,%d,%d,%d", &fields[0], &fields[1], &fields[2], &fields[3],
                            &fields[4], &fields[5]) != 6)
            {
                return std::nullopt;
            }
            for (const auto field : fields)
            {
                if (field < 0 || field > 255)
                {
                    return std::nullopt;
                }
            }
            return static_cast<std::uint16_t>((fields[4] << 8) | fields[5]);
        }

        // "229 Entering Extended Passive Mode (|||port|)"
        std::optional<std::uint16_t> parse_epsv_port(const std::string &reply)
        {
            const auto open = reply.find('(');
            if (open == std::string::npos || open + 4 >= reply.size())
            {
                return std::nullopt;
            }
            const char delimiter = reply[open + 1];
            if (reply[open + 2] != delimiter || reply[open + 3] != delimiter)
            {
                return std::nullopt;
            }
            const auto begin = open + 4;
            const auto end = reply.find(delimiter, begin);
            if (end == std::string::npos)
            {
                return std::nullopt;
            }
            unsigned int port = 0;
            const auto *first = reply.data() + begin;
            const auto *last = reply.data() + end;
            const auto [ptr, ec] = std::from_chars(first, last, port);
            if (ec != std::errc{} || ptr != last || port == 0 || port > 65535)
            {
                return std::nullopt;
            }
            return static_cast<std::uint16_t>(port);
        }

        std::int64_t unix_now()
        {
            using namespace std::chrono;
            return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
        }

        bool is_end_of_stream(const std::error_code &error)
        {
            // Many servers close the data connection without a TLS close_notify.
            return error == asio::error::eof || error == asio::ssl::error::stream_truncated;
        }

        void close_socket(asio::ip::tcp::socket &socket) noexcept
        {
            std::error_code error;
            socket.close(error);
            if (error)
            {
                spdlog::debug("Closing socket: {}", error.message());
            }
        }

    } // namespace

    FtpSession::FtpSession(ConnectionProfile profile, SessionOptions options, const CredentialStore &credentials)
        : ProtocolSession(std::move(profile)),
          options_(std::move(options)),
          credentials_(credentials),
          tls_context_(asio::ssl::context::tls_client)
    {
        tls_context_.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                                 asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 |
                                 asio::ssl::context::no_tlsv1_1);
        if (this->profile().trust.verify_certificate)
        {
            tls_context_.set_default_verify_paths();
            tls_context_.set_verify_mode(asio::ssl::verify_peer);
        }
        else
        {
            spdlog::warn("Certificate verification disabled for {}", this->profile().id);
            tls_context_.set_verify_mode(asio::ssl::verify_none);
        }
        control_.stream = std::make_unique<TlsStream>(io_, tls_context_);
    }

    FtpSession::~FtpSession()
    {
        close();
    }

    void FtpSession::await(std::chrono::milliseconds timeout, const char *what, const std::function<void()> &cancel)
    {
        io_.restart();
        io_.run_for(timeout);
        if (!io_.stopped())
        {
            cancel();
            io_.run();
            throw ConnectionError(std::string(what) + " with " + profile().host + " timed out after " +
                                  std::to_string(timeout.count()) + " ms");
        }
    }

    void FtpSession::abort_sockets() noexcept
    {
        if (control_.stream)
        {
            close_socket(control_.socket());
        }
    }

    void FtpSession::drop_connection() noexcept
    {
        abort_sockets();
        logged_in_ = false;
        mark_connected(false);
    }

    void FtpSession::connect_socket(tcp::socket &socket, const std::string &host, std::uint16_t port)
    {
        tcp::resolver resolver(io_);
        std::error_code error;
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(host, std::to_string(port),
                               [&](const std::error_code &ec, tcp::resolver::results_type results)
                               {
                                   error = ec;
                                   endpoints = std::move(results);
                               });
        await(options_.connect_timeout, "name resolution", [&]
              { resolver.cancel(); });
        if (error)
        {
            throw ConnectionError("cannot resolve " + host + ": " + error.message());
        }

        asio::async_connect(socket, endpoints, [&](const std::error_code &ec, const tcp::endpoint &)
                            { error = ec; });
        await(options_.connect_timeout, "connect", [&]
              { close_socket(socket); });
        if (error)
        {
            throw ConnectionError("cannot connect to " + host + ':' + std::to_string(port) + ": " + error.message());
        }
    }

    void FtpSession::connect_socket(tcp::socket &socket, const tcp::endpoint &endpoint)
    {
        std::error_code error;
        socket.async_connect(endpoint, [&](const std::error_code &ec)
                             { error = ec; });
        await(options_.connect_timeout, "data connect", [&]
              { close_socket(socket); });
        if (error)
        {
            throw TransferError("cannot open data connection to " + endpoint.address().to_string() + ':' +
                                std::to_string(endpoint.port()) + ": " + error.message());
        }
    }

    void FtpSession::tls_handshake(Channel &channel, bool reuse_control_session)
    {
        const auto &host = profile().host;
        auto *ssl = channel.stream->native_handle();
        if (!SSL_set_tlsext_host_name(ssl, const_cast<char *>(host.c_str())))
        {
            spdlog::debug("Could not set SNI name {}", host);
        }
        if (profile().trust.verify_certificate)
        {
            channel.stream->set_verify_callback(asio::ssl::host_name_verification(host));
        }
        // Servers commonly require the data channel to resume the control channel's TLS session.
        if (reuse_control_session && control_.secure)
        {
            if (auto *session = SSL_get_session(control_.stream->native_handle()))
            {
                SSL_set_session(ssl, session);
            }
        }

        std::error_code error;
        channel.stream->async_handshake(asio::ssl::stream_base::client, [&](const std::error_code &ec)
                                        { error = ec; });
        await(options_.connect_timeout, "TLS handshake", [&]
              { close_socket(channel.socket()); });
        if (error)
        {
            const auto verify_result = SSL_get_verify_result(ssl);
            if (profile().trust.verify_certificate && verify_result != X509_V_OK)
            {
                throw AuthenticationError("certificate verification failed for " + host + ": " +
                                          X509_verify_cert_error_string(verify_result));
            }
            throw ConnectionError("TLS handshake with " + host + " failed: " + error.message());
        }
        channel.secure = true;
    }

    void FtpSession::tls_shutdown(Channel &channel) noexcept
    {
        if (!channel.secure || !channel.is_open())
        {
            return;
        }
        std::error_code error;
        channel.stream->async_shutdown([&](const std::error_code &ec)
                                       { error = ec; });
        try
        {
            await(std::min(options_.io_timeout, kShutdownTimeout), "TLS shutdown", [&]
                  { close_socket(channel.socket()); });
        }
        catch (const ConnectionError &ex)
        {
            spdlog::debug("{}", ex.what());
            return;
        }
        if (error && !is_end_of_stream(error))
        {
            spdlog::debug("TLS shutdown with {}: {}", profile().host, error.message());
        }
    }

    std::string FtpSession::read_line(std::chrono::milliseconds timeout)
    {
        std::error_code error;
        std::size_t length = 0;
        auto handler = [&](const std::error_code &ec, std::size_t bytes)
        {
            error = ec;
            length = bytes;
        };
        if (control_.secure)
        {
            asio::async_read_until(*control_.stream, control_buffer_, '\n', handler);
        }
        else
        {
            asio::async_read_until(control_.socket(), control_buffer_, '\n', handler);
        }
        await(timeout, "control read", [this]
              { abort_sockets(); });
        if (error)
        {
            throw ConnectionError("control connection to " + profile().host + " lost: " + error.message());
        }

        const auto begin = asio::buffers_begin(control_buffer_.data());
        std::string line(begin, begin + static_cast<std::ptrdiff_t>(length));
        control_buffer_.consume(length);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        {
            line.pop_back();
        }
        return line;
    }

    FtpSession::Reply FtpSession::read_reply()
    {
        return read_reply(options_.io_timeout);
    }

    FtpSession::Reply FtpSession::read_reply(std::chrono::milliseconds timeout)
    {
        Reply reply;
        auto first = read_line(timeout);
        if (first.size() < 3 || !std::isdigit(static_cast<unsigned char>(first[0])) ||
            !std::isdigit(static_cast<unsigned char>(first[1])) || !std::isdigit(static_cast<unsigned char>(first[2])))
        {
            throw ProtocolError("malformed reply from " + profile().host + ": " + first);
        }
        reply.code = (first[0] - '0') * 100 + (first[1] - '0') * 10 + (first[2] - '0');
        const bool multiline = first.size() > 3 && first[3] == '-';
        const auto terminator = first.substr(0, 3) + ' ';
        reply.lines.push_back(std::move(first));
        if (multiline)
        {
            for (;;)
            {
                auto line = read_line(timeout);
                const bool last = line.rfind(terminator, 0) == 0 || line == terminator.substr(0, 3);
                reply.lines.push_back(std::move(line));
                if (last)
                {
                    break;
                }
            }
        }
        spdlog::debug("<- {}", reply.last());
        return reply;
    }

    void FtpSession::send_command(const std::string &command)
    {
        spdlog::debug("-> {}", redact_command(command));
        std::string wire = command + "\r\n";
        WipeOnExit wipe(wire);
        std::error_code error;
        auto handler = [&](const std::error_code &ec, std::size_t)
        { error = ec; };
        if (control_.secure)
        {
            asio::async_write(*control_.stream, asio::buffer(wire), handler);
        }
        else
        {
            asio::async_write(control_.socket(), asio::buffer(wire), handler);
        }
        await(options_.io_timeout, "control write", [this]
              { abort_sockets(); });
        if (error)
        {
            throw ConnectionError("control connection to " + profile().host + " lost: " + error.message());
        }
    }

    FtpSession::Reply FtpSession::command(const std::string &command)
    {
        send_command(command);
        return read_reply();
    }

    FtpSession::Reply FtpSession::expect(const std::string &command, int family)
    {
        auto reply = this->command(command);
        if (reply.family() != family)
        {
            throw_reply_error(command, reply);
        }
        return reply;
    }

    void FtpSession::throw_reply_error(const std::string &command, const Reply &reply) const
    {
        const auto message = redact_command(command) + ": " + reply.last();
        if (reply.code == 421)
        {
            throw ConnectionError(message);
        }
        if (reply.code == 530 || reply.code == 532)
        {
            throw AuthenticationError(message);
        }
        if (reply.family() == 4)
        {
            throw TransferError(message);
        }
        throw ProtocolError(message);
    }

    void FtpSession::do_connect()
    {
        const auto &target = profile();
        control_.stream = std::make_unique<TlsStream>(io_, tls_context_);
        control_.secure = false;
        control_buffer_.consume(control_buffer_.size());
        features_ = FtpFeatures{};
        data_protected_ = false;
        logged_in_ = false;

        connect_socket(control_.socket(), target.host, target.port);
        if (target.tls == TlsMode::Implicit)
        {
            tls_handshake(control_, false);
        }

        auto greeting = read_reply();
        if (greeting.family() == 1)
        {
            greeting = read_reply();
        }
        if (greeting.family() != 2)
        {
            if (greeting.code == 421)
            {
                throw ConnectionError("server " + target.host + " refused the connection: " + greeting.last());
            }
            throw ProtocolError("unexpected greeting from " + target.host + ": " + greeting.last());
        }

        if (target.tls == TlsMode::Explicit)
        {
            const auto reply = command("AUTH TLS");
            if (reply.code != 234)
            {
                throw ProtocolError("server " + target.host + " refused AUTH TLS: " + reply.last());
            }
            tls_handshake(control_, false);
        }

        login();

        if (target.tls != TlsMode::None)
        {
            expect("PBSZ 0", 2);
            expect("PROT P", 2);
            data_protected_ = true;
        }

        negotiate_features();
        expect("TYPE I", 2);

        if (!target.initial_path.empty() && target.initial_path != "/")
        {
            const auto reply = command("CWD " + target.initial_path);
            if (reply.family() != 2)
            {
                spdlog::warn("Cannot change to initial directory {}: {}", target.initial_path, reply.last());
            }
        }
    }

    void FtpSession::login()
    {
        const auto &user = profile().username;
        auto secret = credentials_.resolve(profile().credential_id);

        auto reply = command("USER " + user);
        if (reply.code == 331 || reply.code == 332)
        {
            std::string password;
            WipeOnExit wipe(password);
            if (secret && !secret->password.empty())
            {
                password = secret->password;
            }
            else if (is_anonymous(user))
            {
                password = kAnonymousPassword;
            }
            else
            {
                throw AuthenticationError("no password available for " + profile().id);
            }
            reply = command("PASS " + password);
        }
        if (secret)
        {
            secret->wipe();
        }

        if (reply.code == 421)
        {
            throw ConnectionError("server closed the connection during login: " + reply.last());
        }
        if (reply.family() != 2)
        {
            throw AuthenticationError("login as " + user + " rejected by " + profile().host + ": " + reply.last());
        }
        logged_in_ = true;
    }

    void FtpSession::negotiate_features()
    {
        const auto reply = command("FEAT");
        if (reply.code != 211)
        {
            spdlog::debug("Server {} does not support FEAT", profile().host);
            return;
        }
        for (std::size_t i = 1; i + 1 < reply.lines.size(); ++i)
        {
            const auto feature = upper(trim(reply.lines[i]));
            const auto name = feature.substr(0, feature.find(' '));
            if (name == "MLST" || name == "MLSD")
            {
                features_.mlst = true;
                features_.mlsd = true;
            }
            else if (feature == "REST STREAM")
            {
                features_.rest_stream = true;
            }
            else if (name == "MFMT")
            {
                features_.mfmt = true;
            }
            else if (name == "MDTM")
            {
                features_.mdtm = true;
            }
            else if (name == "SIZE")
            {
                features_.size = true;
            }
            else if (name == "UTF8")
            {
                features_.utf8 = true;
            }
        }
        if (features_.utf8)
        {
            const auto utf8 = command("OPTS UTF8 ON");
            if (utf8.family() != 2)
            {
                spdlog::debug("OPTS UTF8 ON refused: {}", utf8.last());
            }
        }
        spdlog::debug("Features of {}: mlsd={} rest={} mfmt={} utf8={}", profile().host, features_.mlsd,
                      features_.rest_stream, features_.mfmt, features_.utf8);
    }

    FtpSession::DataConnection FtpSession::open_data_connection()
    {
        return profile().passive ? open_passive() : open_active();
    }

    FtpSession::DataConnection FtpSession::open_passive()
    {
        std::error_code error;
        const auto peer = control_.socket().remote_endpoint(error);
        if (error)
        {
            throw ConnectionError("control connection to " + profile().host + " lost: " + error.message());
        }

        std::optional<std::uint16_t> port;
        if (features_.epsv)
        {
            const auto reply = command("EPSV");
            if (reply.code == 229)
            {
                port = parse_epsv_port(reply.last());
                if (!port)
                {
                    throw ProtocolError("malformed EPSV reply: " + reply.last());
                }
            }
            else if (reply.family() == 5)
            {
                spdlog::debug("EPSV unsupported by {}, falling back to PASV", profile().host);
                features_.epsv = false;
            }
        }
        if (!port)
        {
            const auto reply = command("PASV");
            if (reply.code != 227)
            {
                throw_reply_error("PASV", reply);
            }
            port = parse_pasv_port(reply.last());
            if (!port)
            {
                throw ProtocolError("malformed PASV reply: " + reply.last());
            }
        }

        DataConnection data;
        data.channel.stream = std::make_unique<TlsStream>(io_, tls_context_);
        connect_socket(data.channel.socket(), tcp::endpoint(peer.address(), *port));
        return data;
    }

    FtpSession::DataConnection FtpSession::open_active()
    {
        std::error_code error;
        const auto local = control_.socket().local_endpoint(error);
        if (error)
        {
            throw ConnectionError("control connection to " + profile().host + " lost: " + error.message());
        }

        DataConnection data;
        data.channel.stream = std::make_unique<TlsStream>(io_, tls_context_);
        data.acceptor = std::make_unique<tcp::acceptor>(io_);
        const tcp::endpoint listen_endpoint(local.address(), 0);
        data.acceptor->open(listen_endpoint.protocol(), error);
        if (!error)
        {
            data.acceptor->bind(listen_endpoint, error);
        }
        if (!error)
        {
            data.acceptor->listen(1, error);
        }
        const auto bound = error ? tcp::endpoint{} : data.acceptor->local_endpoint(error);
        if (error)
        {
            throw TransferError("cannot listen for an active data connection: " + error.message());
        }

        const auto address = local.address();
        const auto port = bound.port();
        const auto eprt = "EPRT |" + std::string(address.is_v4() ? "1" : "2") + '|' + address.to_string() + '|' +
                          std::to_string(port) + '|';
        const auto reply = command(eprt);
        if (reply.family() == 2)
        {
            return data;
        }
        if (!address.is_v4())
        {
            throw_reply_error(eprt, reply);
        }
        const auto bytes = address.to_v4().to_bytes();
        const auto port_command = "PORT " + std::to_string(bytes[0]) + ',' + std::to_string(bytes[1]) + ',' +
                                  std::to_string(bytes[2]) + ',' + std::to_string(bytes[3]) + ',' +
                                  std::to_string(port >> 8) + ',' + std::to_string(port & 0xFF);
        expect(port_command, 2);
        return data;
    }

    void FtpSession::begin_transfer(DataConnection &data, const std::string &command)
    {
        const auto reply = this->command(command);
        if (reply.family() != 1)
        {
            throw_reply_error(command, reply);
        }
        if (data.acceptor)
        {
            std::error_code error;
            data.acceptor->async_accept(data.channel.socket(), [&](const std::error_code &ec)
                                        { error = ec; });
            await(options_.connect_timeout, "data accept", [&]
                  {
                      std::error_code close_error;
                      data.acceptor->close(close_error); });
            if (error)
            {
                throw TransferError("server did not open the data connection: " + error.message());
            }
            data.acceptor->close(error);
        }
        if (data_protected_)
        {
            tls_handshake(data.channel, true);
        }
    }

    std::size_t FtpSession::read_data(Channel &channel, char *buffer, std::size_t size, bool &eof)
    {
        std::error_code error;
        std::size_t length = 0;
        auto handler = [&](const std::error_code &ec, std::size_t bytes)
        {
            error = ec;
            length = bytes;
        };
        if (channel.secure)
        {
            channel.stream->async_read_some(asio::buffer(buffer, size), handler);
        }
        else
        {
            channel.socket().async_read_some(asio::buffer(buffer, size), handler);
        }
        await(options_.io_timeout, "data read", [&]
              { close_socket(channel.socket()); });
        if (error)
        {
            if (is_end_of_stream(error))
            {
                eof = true;
                return length;
            }
            throw TransferError("data connection to " + profile().host + " failed: " + error.message());
        }
        return length;
    }

    void FtpSession::write_data(Channel &channel, const char *buffer, std::size_t size)
    {
        std::error_code error;
        auto handler = [&](const std::error_code &ec, std::size_t)
        { error = ec; };
        if (channel.secure)
        {
            asio::async_write(*channel.stream, asio::buffer(buffer, size), handler);
        }
        else
        {
            asio::async_write(channel.socket(), asio::buffer(buffer, size), handler);
        }
        await(options_.io_timeout, "data write", [&]
              { close_socket(channel.socket()); });
        if (error)
        {
            throw TransferError("data connection to " + profile().host + " failed: " + error.message());
        }
    }

    void FtpSession::finish_transfer(DataConnection &data, const std::string &command)
    {
        tls_shutdown(data.channel);
        close_socket(data.channel.socket());
        const auto reply = read_reply();
        if (reply.family() != 2)
        {
            throw_reply_error(command, reply);
        }
    }

    void FtpSession::abort_transfer(DataConnection &data) noexcept
    {
        close_socket(data.channel.socket());
        try
        {
            // Two replies follow ABOR: the transfer's own (226 or 426) and the ABOR ack.
            send_command("ABOR");
            const auto first = read_reply(kShutdownTimeout);
            const auto second = read_reply(kShutdownTimeout);
            spdlog::debug("Transfer aborted on {}: {} / {}", profile().host, first.last(), second.last());
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Abort on {} left the control connection unusable: {}", profile().host, ex.what());
            drop_connection();
        }
    }

    FtpSession::ActiveData::ActiveData(FtpSession &session, Channel &channel) : session_(session)
    {
        ++session_.transfer_serial_;
        session_.active_data_ = &channel;
    }

    FtpSession::ActiveData::~ActiveData()
    {
        session_.active_data_ = nullptr;
    }

    void FtpSession::do_abort_transfer() noexcept
    {
        // The handler runs inside the transferring thread's await(), which then
        // sees the pending read or write fail.
        const auto serial = transfer_serial_.load();
        try
        {
            asio::post(io_, [this, serial]
                       {
                           if (active_data_ && serial == transfer_serial_.load())
                           {
                               close_socket(active_data_->socket());
                           } });
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Cannot interrupt transfer on {}: {}", profile().host, ex.what());
        }
    }

    std::string FtpSession::fetch_text(const std::string &command)
    {
        auto data = open_data_connection();
        begin_transfer(data, command);
        std::string text;
        std::vector<char> buffer(options_.chunk_size);
        try
        {
            bool eof = false;
            while (!eof)
            {
                const auto length = read_data(data.channel, buffer.data(), buffer.size(), eof);
                text.append(buffer.data(), length);
            }
        }
        catch (const std::exception &)
        {
            drop_connection();
            throw;
        }
        finish_transfer(data, command);
        return text;
    }

    Listing FtpSession::do_list(const std::string &path)
    {
        const auto format = features_.mlsd ? ListingFormat::Mlsd : ListingFormat::List;
        const auto text = fetch_text((format == ListingFormat::Mlsd ? "MLSD " : "LIST ") + path);
        auto listing = parse_listing(text, path, format, unix_now());
        if (listing.skipped_lines > 0)
        {
            spdlog::warn("Skipped {} unparseable line(s) listing {}", listing.skipped_lines, path);
        }
        return listing;
    }

    TransferResult FtpSession::do_get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                                      const TransferControl &control)
    {
        if (offset > 0 && !features_.rest_stream)
        {
            throw ProtocolError(profile().host + " does not support resuming transfers");
        }
        auto data = open_data_connection();
        if (offset > 0)
        {
            expect("REST " + std::to_string(offset), 3);
        }
        const auto retr = "RETR " + remote_path;
        begin_transfer(data, retr);
        ActiveData active(*this, data.channel);

        TransferResult result{.bytes_transferred = 0, .final_offset = offset, .completed = false};
        std::vector<char> buffer(options_.chunk_size);
        try
        {
            bool eof = false;
            while (!eof)
            {
                if (control.stop_requested())
                {
                    abort_transfer(data);
                    return result;
                }
                const auto length = read_data(data.channel, buffer.data(), buffer.size(), eof);
                if (length == 0)
                {
                    continue;
                }
                sink.write(buffer.data(), static_cast<std::streamsize>(length));
                if (!sink)
                {
                    throw FileSystemError("writing downloaded data for " + remote_path + " failed");
                }
                result.bytes_transferred += length;
                result.final_offset += length;
                control.report(result.final_offset);
            }
            sink.flush();
            if (!sink)
            {
                throw FileSystemError("flushing downloaded data for " + remote_path + " failed");
            }
        }
        catch (const TransferError &)
        {
            if (!control.stop_requested())
            {
                drop_connection();
                throw;
            }
            // The data connection was closed under a blocked read to stop the transfer.
            abort_transfer(data);
            return result;
        }
        catch (const std::exception &)
        {
            drop_connection();
            throw;
        }
        finish_transfer(data, retr);
        result.completed = true;
        return result;
    }

    TransferResult FtpSession::do_put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                                      const TransferControl &control)
    {
        if (offset > 0 && !features_.rest_stream)
        {
            throw ProtocolError(profile().host + " does not support resuming transfers");
        }
        auto data = open_data_connection();
        if (offset > 0)
        {
            expect("REST " + std::to_string(offset), 3);
        }
        const auto stor = "STOR " + remote_path;
        begin_transfer(data, stor);
        ActiveData active(*this, data.channel);

        TransferResult result{.bytes_transferred = 0, .final_offset = offset, .completed = false};
        std::vector<char> buffer(options_.chunk_size);
        bool stopped = false;
        try
        {
            for (;;)
            {
                if (control.stop_requested())
                {
                    stopped = true;
                    break;
                }
                source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto length = static_cast<std::size_t>(source.gcount());
                if (source.bad())
                {
                    throw FileSystemError("reading local data for " + remote_path + " failed");
                }
                if (length > 0)
                {
                    write_data(data.channel, buffer.data(), length);
                    result.bytes_transferred += length;
                    result.final_offset += length;
                    control.report(result.final_offset);
                }
                if (source.eof() || length == 0)
                {
                    break;
                }
            }
        }
        catch (const TransferError &)
        {
            if (!control.stop_requested())
            {
                drop_connection();
                throw;
            }
            stopped = true;
        }
        catch (const std::exception &)
        {
            drop_connection();
            throw;
        }

        if (stopped)
        {
            // Closing the data connection ends the upload; what arrived so far stays for a later resume.
            tls_shutdown(data.channel);
            close_socket(data.channel.socket());
            const auto reply = read_reply();
            spdlog::debug("Upload of {} interrupted: {}", remote_path, reply.last());
            return result;
        }
        finish_transfer(data, stor);
        result.completed = true;
        return result;
    }

    void FtpSession::do_mkdir(const std::string &path)
    {
        expect("MKD " + path, 2);
    }

    void FtpSession::do_remove(const std::string &path, EntryKind kind)
    {
        expect((kind == EntryKind::Directory ? "RMD " : "DELE ") + path, 2);
    }

    void FtpSession::do_rename(const std::string &from, const std::string &to)
    {
        expect("RNFR " + from, 3);
        expect("RNTO " + to, 2);
    }

    std::optional<RemoteEntry> FtpSession::do_stat(const std::string &path)
    {
        if (features_.mlst)
        {
            const auto reply = command("MLST " + path);
            if (reply.family() == 5)
            {
                return std::nullopt;
            }
            if (reply.family() != 2)
            {
                throw_reply_error("MLST " + path, reply);
            }
            for (std::size_t i = 1; i + 1 < reply.lines.size(); ++i)
            {
                auto entry = parse_mlsd_line(trim(reply.lines[i]));
                if (entry)
                {
                    entry->path = path;
                    entry->name = remote_basename(path);
                    return entry;
                }
            }
            throw ProtocolError("malformed MLST reply for " + path);
        }

        RemoteEntry entry;
        entry.path = path;
        entry.name = remote_basename(path);
        const auto size = command("SIZE " + path);
        if (size.code == 213)
        {
            const auto value = trim(std::string_view(size.last()).substr(3));
            const auto *last = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(value.data(), last, entry.size);
            if (ec != std::errc{} || ptr != last)
            {
                throw ProtocolError("malformed SIZE reply: " + size.last());
            }
            entry.kind = EntryKind::File;
            const auto mdtm = command("MDTM " + path);
            if (mdtm.code == 213)
            {
                entry.modified_time = parse_ftp_timestamp(trim(std::string_view(mdtm.last()).substr(3))).value_or(0);
            }
            return entry;
        }
        const auto cwd = command("CWD " + path);
        if (cwd.family() == 2)
        {
            entry.kind = EntryKind::Directory;
            return entry;
        }
        if (cwd.family() == 5)
        {
            return std::nullopt;
        }
        throw_reply_error("CWD " + path, cwd);
    }

    bool FtpSession::do_set_modified_time(const std::string &path, std::int64_t unix_time)
    {
        if (!features_.mfmt)
        {
            return false;
        }
        const auto mfmt = "MFMT " + format_ftp_timestamp(unix_time) + ' ' + path;
        const auto reply = command(mfmt);
        if (reply.family() == 2)
        {
            return true;
        }
        if (reply.family() == 5)
        {
            spdlog::warn("Server refused to set the time of {}: {}", path, reply.last());
            return false;
        }
        throw_reply_error(mfmt, reply);
    }

    void FtpSession::do_chmod(const std::string &path, std::uint32_t mode)
    {
        char octal[8];
        std::snprintf(octal, sizeof(octal), "%o", static_cast<unsigned>(mode & 07777u));
        expect("SITE CHMOD " + std::string(octal) + ' ' + path, 2);
    }

    void FtpSession::do_close() noexcept
    {
        if (logged_in_ && control_.is_open())
        {
            try
            {
                send_command("QUIT");
                const auto reply = read_reply(kShutdownTimeout);
                spdlog::debug("QUIT acknowledged: {}", reply.last());
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("QUIT to {} failed: {}", profile().host, ex.what());
            }
        }
        logged_in_ = false;
        if (control_.stream)
        {
            close_socket(control_.socket());
        }
    }

} // namespace skiff::client
