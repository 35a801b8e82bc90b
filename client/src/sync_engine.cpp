#include "skiff/client/sync_engine.hpp"

#include <algorithm>
#include <array>
#include <future>
#include <iterator>
#include <set>

#include <fnmatch.h>

#include <spdlog/spdlog.h>

#include "skiff/client/protocol_session.hpp"
#include "skiff/client/session_pool.hpp"
#include "skiff/client/transfer_manager.hpp"
#include "skiff/errors.hpp"

namespace skiff::client
{

    namespace
    {

        template <typename Enum>
        struct Name
        {
            Enum value;
            std::string_view name;
        };

        constexpr std::array<Name<SyncDirection>, 3> kDirectionNames{{
            {SyncDirection::Upload, "upload"},
            {SyncDirection::Download, "download"},
            {SyncDirection::Bidirectional, "bidirectional"},
        }};

        constexpr std::array<Name<ConflictPolicy>, 4> kPolicyNames{{
            {ConflictPolicy::NewerWins, "newer-wins"},
            {ConflictPolicy::AlwaysDownload, "always-download"},
            {ConflictPolicy::AlwaysUpload, "always-upload"},
            {ConflictPolicy::SkipAndReport, "skip-and-report"},
        }};

        constexpr std::array<Name<SyncActionKind>, 7> kActionNames{{
            {SyncActionKind::CreateLocalDirectory, "mkdir-local"},
            {SyncActionKind::CreateRemoteDirectory, "mkdir-remote"},
            {SyncActionKind::Upload, "upload"},
            {SyncActionKind::Download, "download"},
            {SyncActionKind::Conflict, "conflict"},
            {SyncActionKind::DeleteLocal, "delete-local"},
            {SyncActionKind::DeleteRemote, "delete-remote"},
        }};

        constexpr std::array<Name<SyncReason>, 4> kReasonNames{{
            {SyncReason::Added, "added"},
            {SyncReason::Modified, "modified"},
            {SyncReason::Removed, "removed"},
            {SyncReason::Conflict, "conflict"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view name_of(const std::array<Name<Enum>, N> &table, Enum value) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.value == value)
                {
                    return entry.name;
                }
            }
            return "unknown";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<Name<Enum>, N> &table, std::string_view name) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.name == name)
                {
                    return entry.value;
                }
            }
            return std::nullopt;
        }

        bool matches(const std::string &pattern, const std::string &path)
        {
            return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
        }

        bool is_below(const std::string &path, const std::string &directory)
        {
            return path.size() > directory.size() && path.compare(0, directory.size(), directory) == 0 &&
                   path[directory.size()] == '/';
        }

        std::int64_t time_distance(std::int64_t lhs, std::int64_t rhs)
        {
            return lhs > rhs ? lhs - rhs : rhs - lhs;
        }

        SyncAction make_action(SyncActionKind kind, SyncReason reason, const std::string &path,
                               const std::optional<EntryMeta> &local, const std::optional<EntryMeta> &remote,
                               std::string detail = {})
        {
            return SyncAction{kind, reason, path, local, remote, std::move(detail)};
        }

    } // namespace

    std::string_view to_string(SyncDirection direction) noexcept
    {
        return name_of(kDirectionNames, direction);
    }

    std::optional<SyncDirection> sync_direction_from_string(std::string_view value) noexcept
    {
        return value_of(kDirectionNames, value);
    }

    std::string_view to_string(ConflictPolicy policy) noexcept
    {
        return name_of(kPolicyNames, policy);
    }

    std::optional<ConflictPolicy> conflict_policy_from_string(std::string_view value) noexcept
    {
        return value_of(kPolicyNames, value);
    }

    std::string_view to_string(SyncActionKind kind) noexcept
    {
        return name_of(kActionNames, kind);
    }

    std::string_view to_string(SyncReason reason) noexcept
    {
        return name_of(kReasonNames, reason);
    }

    SyncPlan::SyncPlan(std::filesystem::path local_root, std::string remote_root, SyncOptions options,
                       std::vector<SyncAction> actions)
        : local_root_(std::move(local_root)), remote_root_(std::move(remote_root)), options_(std::move(options)),
          actions_(std::move(actions))
    {
    }

    std::size_t SyncPlan::count(SyncActionKind kind) const noexcept
    {
        return static_cast<std::size_t>(std::count_if(actions_.begin(), actions_.end(), [kind](const SyncAction &action)
                                                      { return action.kind == kind; }));
    }

    PlanSummary SyncPlan::summary() const
    {
        PlanSummary summary;
        summary.dry_run = options_.dry_run;
        for (const auto &action : actions_)
        {
            if (action.is_create_directory())
            {
                ++summary.create_dirs;
            }
            else if (action.is_transfer())
            {
                ++summary.transfers;
                const auto &source = action.kind == SyncActionKind::Upload ? action.local : action.remote;
                if (source)
                {
                    summary.bytes += source->size;
                }
            }
            else if (action.is_delete())
            {
                ++summary.deletes;
            }
            else
            {
                ++summary.conflicts;
            }
        }
        return summary;
    }

    bool sync_path_selected(const std::string &relative_path, bool is_directory, const SyncOptions &options)
    {
        // An excluded directory takes its whole subtree with it.
        for (std::size_t slash = relative_path.find('/'); slash != std::string::npos;
             slash = relative_path.find('/', slash + 1))
        {
            const auto ancestor = relative_path.substr(0, slash);
            for (const auto &pattern : options.exclude)
            {
                if (matches(pattern, ancestor))
                {
                    return false;
                }
            }
        }
        for (const auto &pattern : options.exclude)
        {
            if (matches(pattern, relative_path))
            {
                return false;
            }
        }
        if (is_directory || options.include.empty())
        {
            return true;
        }
        return std::any_of(options.include.begin(), options.include.end(), [&](const std::string &pattern)
                           { return matches(pattern, relative_path); });
    }

    Snapshot snapshot_local(const std::vector<LocalEntry> &entries, const SyncOptions &options)
    {
        Snapshot snapshot;
        for (const auto &entry : entries)
        {
            if (entry.kind == EntryKind::Symlink)
            {
                spdlog::debug("Sync skips local symlink {}", entry.relative_path);
                continue;
            }
            const bool directory = entry.kind == EntryKind::Directory;
            if (!sync_path_selected(entry.relative_path, directory, options))
            {
                continue;
            }
            snapshot.emplace(entry.relative_path,
                             EntryMeta{entry.kind, directory ? 0 : entry.size, entry.modified_time});
        }
        return snapshot;
    }

    Snapshot snapshot_remote(ProtocolSession &session, const std::string &remote_root, const SyncOptions &options)
    {
        const auto root = session.stat(remote_root);
        if (!root)
        {
            return {};
        }
        if (!root->is_directory())
        {
            throw ProtocolError(remote_root + " is not a directory");
        }

        Snapshot snapshot;
        std::vector<std::string> pending{""};
        while (!pending.empty())
        {
            const auto relative = pending.back();
            pending.pop_back();
            const auto listing = session.list(relative.empty() ? remote_root : join_remote(remote_root, relative));
            if (listing.skipped_lines > 0)
            {
                spdlog::warn("Skipped {} unparseable listing line(s) in {}", listing.skipped_lines,
                             join_remote(remote_root, relative));
            }
            for (const auto &entry : listing.entries)
            {
                if (entry.kind == EntryKind::Symlink)
                {
                    continue;
                }
                const auto path = relative.empty() ? entry.name : relative + '/' + entry.name;
                if (!sync_path_selected(path, entry.is_directory(), options))
                {
                    continue;
                }
                snapshot.emplace(path, EntryMeta{entry.kind, entry.is_directory() ? 0 : entry.size,
                                                 entry.modified_time});
                if (entry.is_directory())
                {
                    pending.push_back(path);
                }
            }
        }
        return snapshot;
    }

    SyncPlan compute_plan(const Snapshot &local, const Snapshot &remote, const std::filesystem::path &local_root,
                          const std::string &remote_root, const SyncOptions &options)
    {
        const bool upload = options.direction != SyncDirection::Download;
        const bool download = options.direction != SyncDirection::Upload;
        const auto tolerance = options.mtime_tolerance.count();

        std::set<std::string> keys;
        for (const auto &[path, meta] : local)
        {
            keys.insert(path);
        }
        for (const auto &[path, meta] : remote)
        {
            keys.insert(path);
        }

        std::vector<SyncAction> creates;
        std::vector<SyncAction> transfers;
        std::vector<SyncAction> conflicts;
        std::vector<SyncAction> deletes;
        std::vector<std::string> blocked;

        for (const auto &path : keys)
        {
            if (std::any_of(blocked.begin(), blocked.end(), [&](const std::string &dir)
                            { return is_below(path, dir); }))
            {
                continue;
            }
            const auto l = local.find(path);
            const auto r = remote.find(path);
            const std::optional<EntryMeta> local_meta =
                l == local.end() ? std::nullopt : std::optional<EntryMeta>(l->second);
            const std::optional<EntryMeta> remote_meta =
                r == remote.end() ? std::nullopt : std::optional<EntryMeta>(r->second);

            if (local_meta && !remote_meta)
            {
                if (upload)
                {
                    const auto kind = local_meta->kind == EntryKind::Directory ? SyncActionKind::CreateRemoteDirectory
                                                                               : SyncActionKind::Upload;
                    (kind == SyncActionKind::Upload ? transfers : creates)
                        .push_back(make_action(kind, SyncReason::Added, path, local_meta, remote_meta));
                }
                else if (options.delete_extraneous)
                {
                    deletes.push_back(
                        make_action(SyncActionKind::DeleteLocal, SyncReason::Removed, path, local_meta, remote_meta));
                }
                continue;
            }
            if (remote_meta && !local_meta)
            {
                if (download)
                {
                    const auto kind = remote_meta->kind == EntryKind::Directory
                                          ? SyncActionKind::CreateLocalDirectory
                                          : SyncActionKind::Download;
                    (kind == SyncActionKind::Download ? transfers : creates)
                        .push_back(make_action(kind, SyncReason::Added, path, local_meta, remote_meta));
                }
                else if (options.delete_extraneous)
                {
                    deletes.push_back(
                        make_action(SyncActionKind::DeleteRemote, SyncReason::Removed, path, local_meta, remote_meta));
                }
                continue;
            }

            if (local_meta->kind != remote_meta->kind)
            {
                conflicts.push_back(make_action(SyncActionKind::Conflict, SyncReason::Conflict, path, local_meta,
                                                remote_meta, "file and directory with the same name"));
                if (local_meta->kind == EntryKind::Directory || remote_meta->kind == EntryKind::Directory)
                {
                    blocked.push_back(path);
                }
                continue;
            }
            if (local_meta->kind == EntryKind::Directory)
            {
                continue;
            }

            const bool same_time = time_distance(local_meta->modified_time, remote_meta->modified_time) <= tolerance;
            if (same_time && local_meta->size == remote_meta->size)
            {
                continue;
            }

            std::optional<SyncActionKind> outcome;
            std::string detail;
            if (options.policy == ConflictPolicy::SkipAndReport)
            {
                detail = "modified on both sides";
            }
            else if (!download)
            {
                // A one-way sync makes the destination match the source.
                outcome = SyncActionKind::Upload;
            }
            else if (!upload)
            {
                outcome = SyncActionKind::Download;
            }
            else
            {
                switch (options.policy)
                {
                case ConflictPolicy::NewerWins:
                    if (same_time)
                    {
                        detail = "sizes differ but modification times match";
                    }
                    else
                    {
                        outcome = local_meta->modified_time > remote_meta->modified_time ? SyncActionKind::Upload
                                                                                         : SyncActionKind::Download;
                    }
                    break;
                case ConflictPolicy::AlwaysDownload:
                    outcome = SyncActionKind::Download;
                    break;
                case ConflictPolicy::AlwaysUpload:
                    outcome = SyncActionKind::Upload;
                    break;
                case ConflictPolicy::SkipAndReport:
                    break;
                }
            }

            if (outcome)
            {
                transfers.push_back(make_action(*outcome, SyncReason::Modified, path, local_meta, remote_meta));
            }
            else
            {
                conflicts.push_back(make_action(SyncActionKind::Conflict, SyncReason::Conflict, path, local_meta,
                                                remote_meta, detail));
            }
        }

        // Keys are visited parent first; deleting in reverse removes children before their parent.
        std::reverse(deletes.begin(), deletes.end());

        std::vector<SyncAction> actions;
        actions.reserve(creates.size() + transfers.size() + conflicts.size() + deletes.size());
        for (auto *group : {&creates, &transfers, &conflicts, &deletes})
        {
            std::move(group->begin(), group->end(), std::back_inserter(actions));
        }
        return SyncPlan(local_root, remote_root, options, std::move(actions));
    }

    SyncEngine::SyncEngine(SessionPool &pool, TransferManager &transfers, EventBus &events)
        : pool_(pool), transfers_(transfers), events_(events)
    {
    }

    SyncPlan SyncEngine::plan(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                              const std::string &remote_root, const SyncOptions &options)
    {
        auto local_walk = std::async(std::launch::async, [this, local_root]
                                     {
                                         std::error_code ec;
                                         if (!std::filesystem::exists(local_root, ec))
                                         {
                                             return std::vector<LocalEntry>{};
                                         }
                                         return filesystem_.walk(local_root); });

        Snapshot remote;
        {
            auto lease = pool_.acquire(profile);
            remote = snapshot_remote(*lease, remote_root, options);
        }
        const auto local = snapshot_local(local_walk.get(), options);

        auto plan = compute_plan(local, remote, local_root, remote_root, options);
        const auto summary = plan.summary();
        spdlog::info("Sync plan {} <-> {}: {} mkdir, {} transfer(s), {} delete(s), {} conflict(s)",
                     local_root.string(), remote_root, summary.create_dirs, summary.transfers, summary.deletes,
                     summary.conflicts);
        events_.publish(Event{EventKind::SyncPlanReady, summary});
        return plan;
    }

    SyncReport SyncEngine::apply(const ConnectionProfile &profile, const SyncPlan &plan)
    {
        SyncReport report;
        if (plan.options().dry_run)
        {
            spdlog::info("Dry run, {} action(s) not applied", plan.actions().size());
            return report;
        }

        const auto &actions = plan.actions();
        SyncPayload status{profile.id, plan.local_root().string(), plan.remote_root(), 0, actions.size()};
        events_.publish(Event{EventKind::SyncStarted, status});
        try
        {
            if (!plan.empty())
            {
                apply_actions(profile, plan, report, status);
            }
        }
        catch (const Error &ex)
        {
            spdlog::error("Sync {} <-> {} failed: {}", status.local_root, status.remote_root, ex.what());
            status.errors = report.errors.size();
            status.reason = ex.what();
            events_.publish(Event{EventKind::SyncFailed, status});
            throw;
        }
        status.errors = report.errors.size();
        spdlog::info("Sync {} <-> {} applied {} action(s), {} error(s)", status.local_root, status.remote_root,
                     status.done, status.errors);
        events_.publish(Event{EventKind::SyncCompleted, status});
        return report;
    }

    void SyncEngine::apply_actions(const ConnectionProfile &profile, const SyncPlan &plan, SyncReport &report,
                                   SyncPayload &status)
    {
        const auto &actions = plan.actions();
        const bool writes_remote = std::any_of(actions.begin(), actions.end(), [](const SyncAction &action)
                                               { return action.kind == SyncActionKind::Upload ||
                                                        action.kind == SyncActionKind::CreateRemoteDirectory; });
        const bool writes_local = std::any_of(actions.begin(), actions.end(), [](const SyncAction &action)
                                              { return action.kind == SyncActionKind::Download ||
                                                       action.kind == SyncActionKind::CreateLocalDirectory; });

        auto lease = pool_.acquire(profile);
        try
        {
            if (writes_remote)
            {
                lease->ensure_directory(plan.remote_root());
            }
            if (writes_local)
            {
                filesystem_.create_directory(plan.local_root());
            }
        }
        catch (const Error &ex)
        {
            report.errors.push_back(ex.what());
            spdlog::error("Cannot prepare sync roots: {}", ex.what());
        }

        for (const auto &action : actions)
        {
            if (!lease->is_connected())
            {
                lease.discard();
                lease = pool_.acquire(profile);
            }
            apply_action(*lease, plan, action, profile, report);
            ++status.done;
            status.errors = report.errors.size();
            events_.publish(Event{EventKind::SyncProgress, status});
        }
    }

    SyncReport SyncEngine::run(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                               const std::string &remote_root, const SyncOptions &options)
    {
        return apply(profile, plan(profile, local_root, remote_root, options));
    }

    void SyncEngine::apply_action(ProtocolSession &session, const SyncPlan &plan, const SyncAction &action,
                                  const ConnectionProfile &profile, SyncReport &report)
    {
        const auto local_path = plan.local_root() / std::filesystem::path(action.relative_path);
        const auto remote_path = join_remote(plan.remote_root(), action.relative_path);
        try
        {
            switch (action.kind)
            {
            case SyncActionKind::CreateLocalDirectory:
                filesystem_.create_directory(local_path);
                ++report.directories_created;
                break;
            case SyncActionKind::CreateRemoteDirectory:
                session.mkdir(remote_path);
                ++report.directories_created;
                break;
            case SyncActionKind::Upload:
                report.tasks.push_back(
                    transfers_.enqueue(TransferRequest{Direction::Upload, profile, local_path, remote_path, 0}));
                break;
            case SyncActionKind::Download:
                report.tasks.push_back(
                    transfers_.enqueue(TransferRequest{Direction::Download, profile, local_path, remote_path, 0}));
                break;
            case SyncActionKind::Conflict:
                ++report.conflicts;
                spdlog::warn("Sync conflict on {}: {}", action.relative_path, action.detail);
                events_.publish(Event{EventKind::ConflictDetected,
                                      ConflictPayload{action.relative_path, action.local, action.remote, action.detail}});
                break;
            case SyncActionKind::DeleteLocal:
                filesystem_.remove(local_path);
                ++report.deleted;
                break;
            case SyncActionKind::DeleteRemote:
                session.remove(remote_path, action.remote ? action.remote->kind : EntryKind::File);
                ++report.deleted;
                break;
            }
        }
        catch (const Error &ex)
        {
            const auto message = std::string(to_string(action.kind)) + ' ' + action.relative_path + ": " + ex.what();
            spdlog::error("Sync action failed: {}", message);
            report.errors.push_back(message);
            events_.publish(Event{EventKind::Warning, WarningPayload{std::nullopt, message}});
        }
    }

} // namespace skiff::client
