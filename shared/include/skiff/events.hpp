/**
 * Skiff - Events published to the UI layer and the bus that carries them.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "skiff/error_codes.hpp"
#include "skiff/types.hpp"

namespace skiff
{

    enum class EventKind : std::uint8_t
    {
        Connected,
        Disconnected,
        ListingUpdated,
        TransferQueued,
        TransferStarted,
        TransferProgress,
        TransferPaused,
        TransferResumed,
        TransferRetrying,
        TransferCompleted,
        TransferFailed,
        TransferCancelled,
        SyncPlanReady,
        ConflictDetected,
        SyncStarted,
        SyncProgress,
        SyncCompleted,
        SyncFailed,
        Warning
    };

    // Wire names, e.g. "transfer-progress".
    std::string_view to_string(EventKind kind) noexcept;
    std::optional<EventKind> event_kind_from_string(std::string_view value) noexcept;

    struct ConnectionPayload
    {
        std::string profile_id;
        std::string reason{};
    };

    struct ListingPayload
    {
        std::string profile_id;
        std::string path;
        std::vector<RemoteEntry> entries;
        std::size_t skipped_lines{};
    };

    struct TaskPayload
    {
        TaskId task{};
        Direction direction{Direction::Download};
        std::string local_path{};
        std::string remote_path{};
        std::uint64_t offset{};
    };

    struct ProgressPayload
    {
        TaskId task{};
        std::uint64_t bytes_done{};
        std::uint64_t bytes_total{};
    };

    struct FailurePayload
    {
        TaskId task{};
        ErrorKind kind{ErrorKind::Internal};
        std::string reason;
        std::uint32_t attempts{};
    };

    struct RetryPayload
    {
        TaskId task{};
        std::uint32_t attempt{};
        std::chrono::milliseconds delay{};
        ErrorKind kind{ErrorKind::Internal};
        std::string reason;
    };

    struct PlanSummary
    {
        std::size_t create_dirs{};
        std::size_t transfers{};
        std::size_t deletes{};
        std::size_t conflicts{};
        std::uint64_t bytes{};
        bool dry_run{};

        bool empty() const noexcept { return create_dirs == 0 && transfers == 0 && deletes == 0 && conflicts == 0; }
    };

    struct EntryMeta
    {
        EntryKind kind{EntryKind::File};
        std::uint64_t size{};
        std::int64_t modified_time{};
    };

    struct ConflictPayload
    {
        std::string path;
        std::optional<EntryMeta> local;
        std::optional<EntryMeta> remote;
        std::string reason;
    };

    // One applied sync run. `done` counts the plan actions applied so far.
    struct SyncPayload
    {
        std::string profile_id;
        std::string local_root;
        std::string remote_root;
        std::size_t done{};
        std::size_t total{};
        std::size_t errors{};
        std::string reason{};
    };

    struct WarningPayload
    {
        std::optional<TaskId> task;
        std::string message;
    };

    using EventPayload = std::variant<ConnectionPayload, ListingPayload, TaskPayload, ProgressPayload, FailurePayload,
                                      RetryPayload, PlanSummary, ConflictPayload, SyncPayload, WarningPayload>;

    struct Event
    {
        EventKind kind{};
        EventPayload payload;
    };

    /**
     * Publish/subscribe channel owned by one application session and passed
     * explicitly to every component that publishes. Handlers run on the
     * publishing thread, outside the registry lock, so a handler may
     * subscribe or unsubscribe without deadlocking.
     */
    class EventBus
    {
    public:
        using Handler = std::function<void(const Event &)>;
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(Handler handler);
        SubscriptionId subscribe(EventKind kind, Handler handler);
        void unsubscribe(SubscriptionId id);

        void publish(const Event &event) const;

        std::size_t subscriber_count() const;

    private:
        struct Subscriber
        {
            SubscriptionId id;
            std::optional<EventKind> filter;
            std::shared_ptr<const Handler> handler;
        };

        mutable std::mutex mutex_;
        std::vector<Subscriber> subscribers_;
        SubscriptionId next_id_{1};
    };

} // namespace skiff
