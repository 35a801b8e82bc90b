#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "skiff/client/protocol_factory.hpp"
#include "skiff/events.hpp"

namespace skiff::client
{

    /**
     * Connected sessions per profile, at most max_per_profile of them open at
     * once. acquire() blocks on a condition variable while a profile is at its
     * limit and connects outside the lock when it has headroom.
     */
    class SessionPool
    {
    public:
        // Exclusive use of one session. Returns it to the pool when destroyed.
        class Lease
        {
        public:
            Lease() = default;
            ~Lease();

            Lease(Lease &&other) noexcept;
            Lease &operator=(Lease &&other) noexcept;
            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;

            ProtocolSession *operator->() const noexcept { return session_.get(); }
            ProtocolSession &operator*() const noexcept { return *session_; }
            explicit operator bool() const noexcept { return session_ != nullptr; }

            // Close the session on release instead of keeping it for reuse.
            void discard() noexcept { discard_ = true; }

            void release() noexcept;

        private:
            friend class SessionPool;

            Lease(SessionPool *pool, std::string profile_id, std::uint64_t generation,
                  std::unique_ptr<ProtocolSession> session);

            SessionPool *pool_{nullptr};
            std::string profile_id_;
            std::uint64_t generation_{};
            std::unique_ptr<ProtocolSession> session_;
            bool discard_{false};
        };

        SessionPool(SessionFactory factory, std::size_t max_per_profile, EventBus &events);
        ~SessionPool();

        SessionPool(const SessionPool &) = delete;
        SessionPool &operator=(const SessionPool &) = delete;

        // Returns an empty lease when `abort` reports true while waiting for headroom.
        Lease acquire(const ConnectionProfile &profile, const std::function<bool()> &abort = {});

        // Makes waiting acquire() calls re-evaluate their abort predicate.
        void wake_all();

        // Closes idle sessions now; leased ones are closed when they come back.
        void close_profile(const std::string &profile_id, const std::string &reason = "closed");
        void close_all();

        std::size_t in_use(const std::string &profile_id) const;
        std::size_t idle(const std::string &profile_id) const;
        std::size_t max_per_profile() const noexcept { return max_per_profile_; }

    private:
        struct Slot
        {
            std::size_t in_use{};
            std::vector<std::unique_ptr<ProtocolSession>> idle;
            std::uint64_t generation{};
        };

        void give_back(const std::string &profile_id, std::uint64_t generation, std::unique_ptr<ProtocolSession> session,
                       bool discard) noexcept;
        void close_session(ProtocolSession &session, const std::string &reason) noexcept;

        SessionFactory factory_;
        std::size_t max_per_profile_;
        EventBus &events_;
        mutable std::mutex mutex_;
        std::condition_variable available_;
        std::map<std::string, Slot> slots_;
        bool closed_{false};
    };

} // namespace skiff::client
