#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "skiff/client/session_pool.hpp"
#include "skiff/client/sync_engine.hpp"
#include "skiff/client/transfer_manager.hpp"
#include "skiff/events.hpp"

namespace skiff::client
{

    class TransferJournal;

    struct ControllerOptions
    {
        std::size_t max_sessions_per_profile{2};
        TransferManagerOptions transfers{};
    };

    /**
     * Command surface offered to the UI layer. Owns the session pool, the
     * transfer manager and the sync engine for one application session; all
     * of them publish on the bus handed in here.
     */
    class Controller
    {
    public:
        Controller(SessionFactory factory, EventBus &events, ControllerOptions options = {},
                   TransferJournal *journal = nullptr);
        ~Controller();

        Controller(const Controller &) = delete;
        Controller &operator=(const Controller &) = delete;

        // Opens (or reuses) a session so connection problems surface now rather than on first use.
        void connect(const ConnectionProfile &profile);
        void disconnect(const std::string &profile_id);

        Listing list(const ConnectionProfile &profile, const std::string &path);
        std::optional<RemoteEntry> stat(const ConnectionProfile &profile, const std::string &path);
        void mkdir(const ConnectionProfile &profile, const std::string &path);
        void remove(const ConnectionProfile &profile, const std::string &path, EntryKind kind);
        void rename(const ConnectionProfile &profile, const std::string &from, const std::string &to);
        void chmod(const ConnectionProfile &profile, const std::string &path, std::uint32_t mode);

        TaskId enqueue_transfer(TransferRequest request);
        bool pause(TaskId id) { return transfers_.pause(id); }
        bool resume(TaskId id) { return transfers_.resume(id); }
        bool cancel(TaskId id) { return transfers_.cancel(id); }
        bool retry(TaskId id) { return transfers_.retry(id); }
        bool remove_transfer(TaskId id) { return transfers_.remove(id); }

        SyncPlan plan_sync(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                           const std::string &remote_root, const SyncOptions &options);
        SyncReport start_sync(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                              const std::string &remote_root, const SyncOptions &options);
        SyncReport apply_sync(const ConnectionProfile &profile, const SyncPlan &plan);

        TransferManager &transfers() noexcept { return transfers_; }
        SessionPool &pool() noexcept { return pool_; }
        EventBus &events() noexcept { return events_; }

        void shutdown();

    private:
        EventBus &events_;
        SessionPool pool_;
        TransferManager transfers_;
        SyncEngine sync_;
    };

} // namespace skiff::client
