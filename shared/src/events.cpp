#include "skiff/events.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <memory>

#include <spdlog/spdlog.h>

namespace skiff
{

    namespace
    {

        struct EventKindMapping
        {
            EventKind kind;
            std::string_view label;
        };

        constexpr std::array<EventKindMapping, 19> kEventKindMappings{{
            {EventKind::Connected, "connected"},
            {EventKind::Disconnected, "disconnected"},
            {EventKind::ListingUpdated, "listing-updated"},
            {EventKind::TransferQueued, "transfer-queued"},
            {EventKind::TransferStarted, "transfer-started"},
            {EventKind::TransferProgress, "transfer-progress"},
            {EventKind::TransferPaused, "transfer-paused"},
            {EventKind::TransferResumed, "transfer-resumed"},
            {EventKind::TransferRetrying, "transfer-retrying"},
            {EventKind::TransferCompleted, "transfer-completed"},
            {EventKind::TransferFailed, "transfer-failed"},
            {EventKind::TransferCancelled, "transfer-cancelled"},
            {EventKind::SyncPlanReady, "sync-plan-ready"},
            {EventKind::ConflictDetected, "conflict-detected"},
            {EventKind::SyncStarted, "sync-started"},
            {EventKind::SyncProgress, "sync-progress"},
            {EventKind::SyncCompleted, "sync-completed"},
            {EventKind::SyncFailed, "sync-failed"},
            {EventKind::Warning, "warning"},
        }};

    } // namespace

    std::string_view to_string(EventKind kind) noexcept
    {
        for (const auto &mapping : kEventKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<EventKind> event_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kEventKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    EventBus::SubscriptionId EventBus::subscribe(Handler handler)
    {
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        subscribers_.push_back(Subscriber{id, std::nullopt, std::make_shared<const Handler>(std::move(handler))});
        return id;
    }

    EventBus::SubscriptionId EventBus::subscribe(EventKind kind, Handler handler)
    {
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        subscribers_.push_back(Subscriber{id, kind, std::make_shared<const Handler>(std::move(handler))});
        return id;
    }

    void EventBus::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(), [id](const Subscriber &subscriber)
                                          { return subscriber.id == id; }),
                           subscribers_.end());
    }

    void EventBus::publish(const Event &event) const
    {
        std::vector<std::shared_ptr<const Handler>> targets;
        {
            std::lock_guard lock(mutex_);
            targets.reserve(subscribers_.size());
            for (const auto &subscriber : subscribers_)
            {
                if (!subscriber.filter || *subscriber.filter == event.kind)
                {
                    targets.push_back(subscriber.handler);
                }
            }
        }
        for (const auto &handler : targets)
        {
            try
            {
                (*handler)(event);
            }
            catch (const std::exception &ex)
            {
                // A faulty subscriber must not break the publisher's state machine.
                spdlog::error("Event handler for '{}' threw: {}", to_string(event.kind), ex.what());
            }
        }
    }

    std::size_t EventBus::subscriber_count() const
    {
        std::lock_guard lock(mutex_);
        return subscribers_.size();
    }

} // namespace skiff
