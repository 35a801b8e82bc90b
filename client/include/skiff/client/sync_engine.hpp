/**
 * Skiff - Directory synchronisation: snapshot both trees, diff them into an
 * immutable ordered plan, then apply the plan through the transfer manager.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "skiff/client/local_filesystem.hpp"
#include "skiff/events.hpp"
#include "skiff/types.hpp"

namespace skiff::client
{

    class ProtocolSession;
    class SessionPool;
    class TransferManager;

    enum class SyncDirection : std::uint8_t
    {
        Upload,
        Download,
        Bidirectional
    };

    std::string_view to_string(SyncDirection direction) noexcept;
    std::optional<SyncDirection> sync_direction_from_string(std::string_view value) noexcept;

    enum class ConflictPolicy : std::uint8_t
    {
        NewerWins,
        AlwaysDownload,
        AlwaysUpload,
        SkipAndReport
    };

    std::string_view to_string(ConflictPolicy policy) noexcept;
    std::optional<ConflictPolicy> conflict_policy_from_string(std::string_view value) noexcept;

    struct SyncOptions
    {
        SyncDirection direction{SyncDirection::Upload};
        // Settles files modified on both sides of a bidirectional sync. A one-way
        // sync always copies towards its destination unless this is skip-and-report.
        ConflictPolicy policy{ConflictPolicy::NewerWins};
        // Modification times closer than this compare equal.
        std::chrono::seconds mtime_tolerance{2};
        // Remove entries that exist only on the destination side of a one-way sync.
        bool delete_extraneous{false};
        // fnmatch patterns over the relative path. Includes select files only.
        std::vector<std::string> include{};
        std::vector<std::string> exclude{};
        bool dry_run{false};
    };

    enum class SyncActionKind : std::uint8_t
    {
        CreateLocalDirectory,
        CreateRemoteDirectory,
        Upload,
        Download,
        Conflict,
        DeleteLocal,
        DeleteRemote
    };

    std::string_view to_string(SyncActionKind kind) noexcept;

    enum class SyncReason : std::uint8_t
    {
        Added,
        Modified,
        Removed,
        Conflict
    };

    std::string_view to_string(SyncReason reason) noexcept;

    struct SyncAction
    {
        SyncActionKind kind{SyncActionKind::Upload};
        SyncReason reason{SyncReason::Added};
        std::string relative_path;
        std::optional<EntryMeta> local{};
        std::optional<EntryMeta> remote{};
        std::string detail{};

        bool is_transfer() const noexcept { return kind == SyncActionKind::Upload || kind == SyncActionKind::Download; }
        bool is_delete() const noexcept
        {
            return kind == SyncActionKind::DeleteLocal || kind == SyncActionKind::DeleteRemote;
        }
        bool is_create_directory() const noexcept
        {
            return kind == SyncActionKind::CreateLocalDirectory || kind == SyncActionKind::CreateRemoteDirectory;
        }
    };

    // Relative path -> metadata, after filtering.
    using Snapshot = std::map<std::string, EntryMeta>;

    /**
     * Ordered actions: directory creations (parents first), transfers,
     * conflicts, deletions (children first). Built once, never modified.
     */
    class SyncPlan
    {
    public:
        SyncPlan(std::filesystem::path local_root, std::string remote_root, SyncOptions options,
                 std::vector<SyncAction> actions);

        const std::filesystem::path &local_root() const noexcept { return local_root_; }
        const std::string &remote_root() const noexcept { return remote_root_; }
        const SyncOptions &options() const noexcept { return options_; }
        const std::vector<SyncAction> &actions() const noexcept { return actions_; }

        bool empty() const noexcept { return actions_.empty(); }
        std::size_t count(SyncActionKind kind) const noexcept;
        PlanSummary summary() const;

    private:
        std::filesystem::path local_root_;
        std::string remote_root_;
        SyncOptions options_;
        std::vector<SyncAction> actions_;
    };

    bool sync_path_selected(const std::string &relative_path, bool is_directory, const SyncOptions &options);

    Snapshot snapshot_local(const std::vector<LocalEntry> &entries, const SyncOptions &options);

    // Recursive listing below remote_root. A missing root is an empty snapshot.
    Snapshot snapshot_remote(ProtocolSession &session, const std::string &remote_root, const SyncOptions &options);

    // Pure diff; the same inputs always give the same plan.
    SyncPlan compute_plan(const Snapshot &local, const Snapshot &remote, const std::filesystem::path &local_root,
                          const std::string &remote_root, const SyncOptions &options);

    struct SyncReport
    {
        std::vector<TaskId> tasks;
        std::size_t directories_created{};
        std::size_t deleted{};
        std::size_t conflicts{};
        std::vector<std::string> errors;
    };

    class SyncEngine
    {
    public:
        SyncEngine(SessionPool &pool, TransferManager &transfers, EventBus &events);

        // Snapshots both sides (the local walk runs on its own thread) and publishes sync-plan-ready.
        SyncPlan plan(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                      const std::string &remote_root, const SyncOptions &options);

        // Directory actions and deletions run here; transfers are enqueued. A
        // failing action is reported and skipped, the rest of the plan proceeds.
        // Publishes sync-started, sync-progress per action, then sync-completed,
        // or sync-failed when the session itself cannot be obtained.
        SyncReport apply(const ConnectionProfile &profile, const SyncPlan &plan);

        SyncReport run(const ConnectionProfile &profile, const std::filesystem::path &local_root,
                       const std::string &remote_root, const SyncOptions &options);

    private:
        void apply_actions(const ConnectionProfile &profile, const SyncPlan &plan, SyncReport &report,
                           SyncPayload &status);
        void apply_action(ProtocolSession &session, const SyncPlan &plan, const SyncAction &action,
                          const ConnectionProfile &profile, SyncReport &report);

        SessionPool &pool_;
        TransferManager &transfers_;
        EventBus &events_;
        LocalFileSystem filesystem_;
    };

} // namespace skiff::client
