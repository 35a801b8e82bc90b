#include "skiff/client/controller.hpp"

#include <spdlog/spdlog.h>

namespace skiff::client
{

    Controller::Controller(SessionFactory factory, EventBus &events, ControllerOptions options,
                           TransferJournal *journal)
        : events_(events),
          pool_(std::move(factory), options.max_sessions_per_profile, events),
          transfers_(pool_, events, options.transfers, journal),
          sync_(pool_, transfers_, events)
    {
    }

    Controller::~Controller()
    {
        shutdown();
    }

    void Controller::connect(const ConnectionProfile &profile)
    {
        auto lease = pool_.acquire(profile);
        spdlog::debug("Session for {} ready", profile.id);
    }

    void Controller::disconnect(const std::string &profile_id)
    {
        pool_.close_profile(profile_id, "disconnected");
    }

    Listing Controller::list(const ConnectionProfile &profile, const std::string &path)
    {
        auto lease = pool_.acquire(profile);
        auto listing = lease->list(path);
        lease.release();
        events_.publish(Event{EventKind::ListingUpdated,
                              ListingPayload{profile.id, path, listing.entries, listing.skipped_lines}});
        return listing;
    }

    std::optional<RemoteEntry> Controller::stat(const ConnectionProfile &profile, const std::string &path)
    {
        auto lease = pool_.acquire(profile);
        return lease->stat(path);
    }

    void Controller::mkdir(const ConnectionProfile &profile, const std::string &path)
    {
        auto lease = pool_.acquire(profile);
        lease->mkdir(path);
    }

    void Controller::remove(const ConnectionProfile &profile, const std::string &path, EntryKind kind)
    {
        auto lease = pool_.acquire(profile);
        lease->remove(path, kind);
    }

    void Controller::rename(const ConnectionProfile &profile, const std::string &from, const std::string &to)
    {
        auto lease = pool_.acquire(profile);
        lease->rename(from, to);
    }

    void Controller::chmod(const ConnectionProfile &profile, const std::string &path, std::uint32_t mode)
    {
        auto lease = pool_.acquire(profile);
        lease->chmod(path, mode);
    }

    TaskId Controller::enqueue_transfer(TransferRequest request)
    {
        return transfers_.enqueue(std::move(request));
    }

    SyncPlan Controller::plan_sync(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                                   const std::string &remote_root, const SyncOptions &options)
    {
        return sync_.plan(profile, local_root, remote_root, options);
    }

    SyncReport Controller::start_sync(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                                      const std::string &remote_root, const SyncOptions &options)
    {
        return sync_.run(profile, local_root, remote_root, options);
    }

    SyncReport Controller::apply_sync(const ConnectionProfile &profile, const SyncPlan &plan)
    {
        return sync_.apply(profile, plan);
    }

    void Controller::shutdown()
    {
        transfers_.shutdown();
        pool_.close_all();
    }

} // namespace skiff::client
