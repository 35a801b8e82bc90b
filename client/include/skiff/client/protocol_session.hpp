/**
 * Skiff - Uniform session contract over FTP, FTPS and SFTP.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include "skiff/types.hpp"

namespace skiff::client
{

    class CredentialStore;

    struct SessionOptions
    {
        std::chrono::milliseconds connect_timeout{30000};
        std::chrono::milliseconds io_timeout{60000};
        std::size_t chunk_size{64 * 1024};
        std::filesystem::path known_hosts{};
    };

    // Hooks a running get/put consults between chunks.
    struct TransferControl
    {
        // Receives the absolute position reached (start offset plus bytes moved).
        std::function<void(std::uint64_t)> on_progress{};
        std::function<bool()> should_stop{};

        bool stop_requested() const { return should_stop && should_stop(); }

        void report(std::uint64_t position) const
        {
            if (on_progress)
            {
                on_progress(position);
            }
        }
    };

    struct TransferResult
    {
        std::uint64_t bytes_transferred{};
        std::uint64_t final_offset{};
        // False when the transfer stopped early because should_stop() said so.
        bool completed{};
    };

    /**
     * One live connection. Public operations are serialized by an internal
     * mutex so two logical operations never interleave on the wire; variants
     * implement the protected do_* hooks and may assume the lock is held.
     *
     * get() and put() take streams already positioned at `offset`.
     */
    class ProtocolSession
    {
    public:
        explicit ProtocolSession(ConnectionProfile profile);
        virtual ~ProtocolSession() = default;

        ProtocolSession(const ProtocolSession &) = delete;
        ProtocolSession &operator=(const ProtocolSession &) = delete;

        const ConnectionProfile &profile() const noexcept { return profile_; }

        void connect();

        Listing list(const std::string &path);

        TransferResult get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                           const TransferControl &control);

        TransferResult put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                           const TransferControl &control);

        // Metadata operations succeed when the target is already in the requested state.
        void mkdir(const std::string &path);
        void remove(const std::string &path, EntryKind kind);
        void rename(const std::string &from, const std::string &to);

        std::optional<RemoteEntry> stat(const std::string &path);

        // Returns false when the server has no way to set timestamps.
        bool set_modified_time(const std::string &path, std::int64_t unix_time);

        void chmod(const std::string &path, std::uint32_t mode);

        // mkdir -p
        void ensure_directory(const std::string &path);

        // Whether get/put honour a non-zero offset. Valid after connect().
        virtual bool supports_resume() const noexcept = 0;

        bool is_connected() const noexcept { return connected_.load(); }

        // Idempotent.
        void close() noexcept;

        // Callable from any thread while get() or put() runs elsewhere: breaks a
        // read or write blocked on the data connection so the running transfer
        // returns without waiting for the I/O timeout. A no-op when idle.
        void abort_transfer() noexcept { do_abort_transfer(); }

    protected:
        virtual void do_connect() = 0;
        virtual Listing do_list(const std::string &path) = 0;
        virtual TransferResult do_get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                                      const TransferControl &control) = 0;
        virtual TransferResult do_put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                                      const TransferControl &control) = 0;
        virtual void do_mkdir(const std::string &path) = 0;
        virtual void do_remove(const std::string &path, EntryKind kind) = 0;
        virtual void do_rename(const std::string &from, const std::string &to) = 0;
        virtual std::optional<RemoteEntry> do_stat(const std::string &path) = 0;
        virtual bool do_set_modified_time(const std::string &path, std::int64_t unix_time) = 0;
        virtual void do_chmod(const std::string &path, std::uint32_t mode) = 0;
        virtual void do_close() noexcept = 0;
        // Runs without the session lock.
        virtual void do_abort_transfer() noexcept {}

        void mark_connected(bool connected) noexcept { connected_.store(connected); }

        // Resolves a path relative to the profile's initial directory.
        std::string resolve(const std::string &path) const;

    private:
        template <typename Operation>
        auto run(const char *name, Operation &&operation);

        ConnectionProfile profile_;
        std::mutex mutex_;
        std::atomic<bool> connected_{false};
    };

} // namespace skiff::client
