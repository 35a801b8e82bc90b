#include "skiff/client/session_pool.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "skiff/errors.hpp"

namespace skiff::client
{

    SessionPool::Lease::Lease(SessionPool *pool, std::string profile_id, std::uint64_t generation,
                              std::unique_ptr<ProtocolSession> session)
        : pool_(pool), profile_id_(std::move(profile_id)), generation_(generation), session_(std::move(session))
    {
    }

    SessionPool::Lease::~Lease()
    {
        release();
    }

    SessionPool::Lease::Lease(Lease &&other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), profile_id_(std::move(other.profile_id_)),
          generation_(other.generation_), session_(std::move(other.session_)), discard_(other.discard_)
    {
    }

    SessionPool::Lease &SessionPool::Lease::operator=(Lease &&other) noexcept
    {
        if (this != &other)
        {
            release();
            pool_ = std::exchange(other.pool_, nullptr);
            profile_id_ = std::move(other.profile_id_);
            generation_ = other.generation_;
            session_ = std::move(other.session_);
            discard_ = other.discard_;
        }
        return *this;
    }

    void SessionPool::Lease::release() noexcept
    {
        if (pool_ && session_)
        {
            pool_->give_back(profile_id_, generation_, std::move(session_), discard_);
        }
        pool_ = nullptr;
        session_.reset();
    }

    SessionPool::SessionPool(SessionFactory factory, std::size_t max_per_profile, EventBus &events)
        : factory_(std::move(factory)), max_per_profile_(max_per_profile == 0 ? 1 : max_per_profile), events_(events)
    {
    }

    SessionPool::~SessionPool()
    {
        close_all();
    }

    SessionPool::Lease SessionPool::acquire(const ConnectionProfile &profile, const std::function<bool()> &abort)
    {
        std::uint64_t generation = 0;
        {
            std::unique_lock lock(mutex_);
            while (true)
            {
                if (closed_)
                {
                    throw ConnectionError("session pool is closed");
                }
                if (abort && abort())
                {
                    return {};
                }
                auto &slot = slots_[profile.id];
                while (!slot.idle.empty())
                {
                    auto session = std::move(slot.idle.back());
                    slot.idle.pop_back();
                    if (session->is_connected())
                    {
                        ++slot.in_use;
                        return Lease(this, profile.id, slot.generation, std::move(session));
                    }
                    spdlog::debug("Dropping dead idle session for {}", profile.id);
                }
                if (slot.in_use < max_per_profile_)
                {
                    ++slot.in_use;
                    generation = slot.generation;
                    break;
                }
                available_.wait(lock);
            }
        }

        // Connect without holding the lock; the slot is already reserved.
        std::unique_ptr<ProtocolSession> session;
        try
        {
            session = factory_(profile);
            session->connect();
        }
        catch (...)
        {
            {
                std::lock_guard lock(mutex_);
                --slots_[profile.id].in_use;
            }
            available_.notify_all();
            throw;
        }
        events_.publish(Event{EventKind::Connected, ConnectionPayload{profile.id}});
        return Lease(this, profile.id, generation, std::move(session));
    }

    void SessionPool::wake_all()
    {
        std::lock_guard lock(mutex_);
        available_.notify_all();
    }

    void SessionPool::close_profile(const std::string &profile_id, const std::string &reason)
    {
        std::vector<std::unique_ptr<ProtocolSession>> idle;
        {
            std::lock_guard lock(mutex_);
            auto it = slots_.find(profile_id);
            if (it == slots_.end())
            {
                return;
            }
            ++it->second.generation;
            idle = std::move(it->second.idle);
            it->second.idle.clear();
        }
        for (auto &session : idle)
        {
            close_session(*session, reason);
        }
        available_.notify_all();
    }

    void SessionPool::close_all()
    {
        std::vector<std::unique_ptr<ProtocolSession>> idle;
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            for (auto &[id, slot] : slots_)
            {
                ++slot.generation;
                for (auto &session : slot.idle)
                {
                    idle.push_back(std::move(session));
                }
                slot.idle.clear();
            }
        }
        for (auto &session : idle)
        {
            close_session(*session, "shutdown");
        }
        available_.notify_all();
    }

    std::size_t SessionPool::in_use(const std::string &profile_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = slots_.find(profile_id);
        return it == slots_.end() ? 0 : it->second.in_use;
    }

    std::size_t SessionPool::idle(const std::string &profile_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = slots_.find(profile_id);
        return it == slots_.end() ? 0 : it->second.idle.size();
    }

    void SessionPool::give_back(const std::string &profile_id, std::uint64_t generation,
                                std::unique_ptr<ProtocolSession> session, bool discard) noexcept
    {
        std::string reason;
        {
            std::lock_guard lock(mutex_);
            auto &slot = slots_[profile_id];
            if (slot.in_use > 0)
            {
                --slot.in_use;
            }
            if (closed_)
            {
                reason = "shutdown";
            }
            else if (generation != slot.generation)
            {
                reason = "closed";
            }
            else if (discard)
            {
                reason = "discarded";
            }
            else if (!session->is_connected())
            {
                reason = "connection lost";
            }
            else
            {
                slot.idle.push_back(std::move(session));
            }
        }
        available_.notify_all();
        if (session)
        {
            close_session(*session, reason);
        }
    }

    void SessionPool::close_session(ProtocolSession &session, const std::string &reason) noexcept
    {
        session.close();
        try
        {
            events_.publish(Event{EventKind::Disconnected, ConnectionPayload{session.profile().id, reason}});
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Publishing disconnect of {} failed: {}", session.profile().id, ex.what());
        }
    }

} // namespace skiff::client
