#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <unistd.h>

#include "skiff/client/local_filesystem.hpp"
#include "skiff/client/protocol_factory.hpp"
#include "skiff/client/protocol_session.hpp"
#include "skiff/errors.hpp"
#include "skiff/events.hpp"

namespace skiff::test
{

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Fresh directory under the system temp dir, removed again on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / ("skiff_" + name + "_" + std::to_string(::getpid())))
        {
            cleanup_path(path_);
            std::filesystem::create_directories(path_);
        }
        ~TempDir() { cleanup_path(path_); }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }
        std::filesystem::path operator/(const std::string &child) const { return path_ / child; }

    private:
        std::filesystem::path path_;
    };

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline std::string make_content(std::size_t size, char seed = 'a')
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>(seed + static_cast<char>(i % 23));
        }
        return content;
    }

    inline void set_mtime(const std::filesystem::path &path, std::int64_t unix_time)
    {
        client::LocalFileSystem{}.set_modified_time(path, unix_time);
    }

    inline bool wait_until(const std::function<bool()> &predicate,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    ConnectionProfile fake_profile(const std::string &initial_path = "/");

    // Remote side shared by every FakeSession of one test: a local directory
    // plus knobs for failure injection and throttling.
    struct FakeRemote
    {
        std::filesystem::path root;
        bool resume{true};
        std::size_t chunk_size{16};
        std::chrono::milliseconds chunk_delay{0};
        // After the first chunk a get blocks this long, as on a dead data connection,
        // unless abort_transfer() breaks it off with a TransferError.
        std::chrono::milliseconds stall{0};
        std::atomic<int> aborts{0};
        // Each get/put consumes one and fails with a TransferError while positive.
        std::atomic<int> failures{0};
        // Fail every connect attempt with a ConnectionError.
        std::atomic<bool> refuse_connect{false};
        std::atomic<int> connects{0};
        std::atomic<int> open_sessions{0};
        std::atomic<int> transfers_in_flight{0};
        std::atomic<int> peak_in_flight{0};

        std::filesystem::path local(const std::string &remote_path) const;
    };

    class FakeSession final : public client::ProtocolSession
    {
    public:
        FakeSession(ConnectionProfile profile, FakeRemote &remote);
        ~FakeSession() override;

        bool supports_resume() const noexcept override { return remote_.resume; }

    protected:
        void do_connect() override;
        Listing do_list(const std::string &path) override;
        client::TransferResult do_get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                                      const client::TransferControl &control) override;
        client::TransferResult do_put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                                      const client::TransferControl &control) override;
        void do_mkdir(const std::string &path) override;
        void do_remove(const std::string &path, EntryKind kind) override;
        void do_rename(const std::string &from, const std::string &to) override;
        std::optional<RemoteEntry> do_stat(const std::string &path) override;
        bool do_set_modified_time(const std::string &path, std::int64_t unix_time) override;
        void do_chmod(const std::string &path, std::uint32_t mode) override;
        void do_close() noexcept override;
        void do_abort_transfer() noexcept override;

    private:
        void begin_transfer();
        void end_transfer() noexcept;
        void stall();

        FakeRemote &remote_;
        bool open_{false};
        std::mutex abort_mutex_;
        std::condition_variable abort_signal_;
        bool aborted_{false};
    };

    client::SessionFactory fake_factory(FakeRemote &remote);

    std::optional<TaskId> event_task(const Event &event);

    // Collects every event published on a bus.
    class EventRecorder
    {
    public:
        explicit EventRecorder(EventBus &bus);
        ~EventRecorder();

        EventRecorder(const EventRecorder &) = delete;
        EventRecorder &operator=(const EventRecorder &) = delete;

        std::vector<Event> events() const;
        std::size_t count(EventKind kind) const;
        std::size_t count(EventKind kind, TaskId task) const;

    private:
        EventBus &bus_;
        EventBus::SubscriptionId subscription_{};
        mutable std::mutex mutex_;
        std::vector<Event> events_;
    };

    // Minimal single-user FTP server on 127.0.0.1 with an in-memory tree,
    // enough of RFC 959/3659 for FtpSession: EPSV, SIZE, MDTM, MFMT, REST, LIST.
    class LoopbackFtpServer
    {
    public:
        LoopbackFtpServer(std::string user, std::string password);
        ~LoopbackFtpServer();

        LoopbackFtpServer(const LoopbackFtpServer &) = delete;
        LoopbackFtpServer &operator=(const LoopbackFtpServer &) = delete;

        std::uint16_t port() const noexcept { return port_; }

        void add_directory(const std::string &path);
        void add_file(const std::string &path, std::string content, std::int64_t mtime = 1704067200);
        // RETR sends this many bytes, then holds the data connection open until the client closes it.
        void stall_downloads(std::size_t after_bytes);
        std::optional<std::string> file(const std::string &path) const;
        std::optional<std::int64_t> mtime(const std::string &path) const;
        std::vector<std::string> commands() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::uint16_t port_{};
    };

    // Implicit-TLS endpoint on 127.0.0.1 presenting a freshly generated
    // self-signed certificate. Serves one connection: handshake, then a 220 greeting.
    class SelfSignedTlsServer
    {
    public:
        SelfSignedTlsServer();
        ~SelfSignedTlsServer();

        SelfSignedTlsServer(const SelfSignedTlsServer &) = delete;
        SelfSignedTlsServer &operator=(const SelfSignedTlsServer &) = delete;

        std::uint16_t port() const noexcept { return port_; }
        // False until a client completes the handshake.
        bool handshake_completed() const noexcept { return handshake_completed_.load(); }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::uint16_t port_{};
        std::atomic<bool> handshake_completed_{false};
    };

} // namespace skiff::test
