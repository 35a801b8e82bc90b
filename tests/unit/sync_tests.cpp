#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "skiff/client/controller.hpp"
#include "skiff/client/sync_engine.hpp"

#include "test_support.hpp"

using namespace skiff;
using namespace skiff::client;
using namespace std::chrono_literals;

namespace
{

    EntryMeta file_meta(std::uint64_t size, std::int64_t mtime)
    {
        return EntryMeta{EntryKind::File, size, mtime};
    }

    EntryMeta dir_meta()
    {
        return EntryMeta{EntryKind::Directory, 0, 0};
    }

    SyncOptions options_for(SyncDirection direction, ConflictPolicy policy = ConflictPolicy::NewerWins)
    {
        SyncOptions options;
        options.direction = direction;
        options.policy = policy;
        return options;
    }

    std::vector<std::string> describe(const SyncPlan &plan)
    {
        std::vector<std::string> lines;
        for (const auto &action : plan.actions())
        {
            lines.push_back(std::string(to_string(action.kind)) + ' ' + action.relative_path);
        }
        return lines;
    }

    void test_local_only_file_uploads()
    {
        const Snapshot local{{"new.txt", file_meta(10, 1000)}};
        const auto plan = compute_plan(local, {}, "/tmp/l", "/r", options_for(SyncDirection::Upload));
        assert(plan.actions().size() == 1);
        assert(plan.actions()[0].kind == SyncActionKind::Upload);
        assert(plan.actions()[0].reason == SyncReason::Added);
        assert(plan.count(SyncActionKind::DeleteLocal) + plan.count(SyncActionKind::DeleteRemote) == 0);
        const auto summary = plan.summary();
        assert(summary.transfers == 1 && summary.bytes == 10 && summary.deletes == 0);
    }

    void test_matching_trees_need_nothing()
    {
        const Snapshot local{{"a", file_meta(5, 1000)}, {"d", dir_meta()}, {"d/b", file_meta(7, 2000)}};
        Snapshot remote = local;
        // Within the modification time tolerance.
        remote["d/b"].modified_time = 2002;
        for (const auto direction : {SyncDirection::Upload, SyncDirection::Download, SyncDirection::Bidirectional})
        {
            const auto plan = compute_plan(local, remote, "/tmp/l", "/r", options_for(direction));
            assert(plan.empty());
            assert(plan.summary().empty());
        }

        auto strict = options_for(SyncDirection::Bidirectional);
        strict.mtime_tolerance = 0s;
        const auto plan = compute_plan(local, remote, "/tmp/l", "/r", strict);
        assert(describe(plan) == std::vector<std::string>{"download d/b"});
    }

    void test_plan_order()
    {
        const Snapshot local{{"d", dir_meta()}, {"d/e", dir_meta()}, {"d/e/f", file_meta(1, 10)}, {"g", file_meta(2, 10)}};
        const Snapshot remote{{"old", dir_meta()}, {"old/x", file_meta(3, 10)}, {"old/y", dir_meta()}};
        auto mirror = options_for(SyncDirection::Upload);
        mirror.delete_extraneous = true;
        const auto plan = compute_plan(local, remote, "/tmp/l", "/r", mirror);
        const std::vector<std::string> expected{
            "mkdir-remote d", "mkdir-remote d/e", "upload d/e/f", "upload g",
            "delete-remote old/y", "delete-remote old/x", "delete-remote old"};
        assert(describe(plan) == expected);

        // Extraneous remote entries are kept unless deletion is asked for.
        const auto kept = compute_plan(local, remote, "/tmp/l", "/r", options_for(SyncDirection::Upload));
        assert(kept.count(SyncActionKind::DeleteRemote) == 0);
        assert(kept.actions().size() == 4);
    }

    void test_newer_wins()
    {
        const Snapshot local{{"l", file_meta(1, 5000)}, {"r", file_meta(1, 1000)}, {"same", file_meta(1, 3000)}};
        const Snapshot remote{{"l", file_meta(2, 1000)}, {"r", file_meta(2, 5000)}, {"same", file_meta(2, 3001)}};
        const auto plan = compute_plan(local, remote, "/tmp/l", "/r", options_for(SyncDirection::Bidirectional));
        const std::vector<std::string> expected{"upload l", "download r", "conflict same"};
        assert(describe(plan) == expected);
        assert(plan.actions()[0].reason == SyncReason::Modified);
        assert(plan.actions()[2].reason == SyncReason::Conflict);
        assert(!plan.actions()[2].detail.empty());
    }

    void test_one_way_copies_towards_destination()
    {
        // The remote copy is newer, yet an upload sync still overwrites it.
        const Snapshot local{{"f", file_meta(1, 1000)}};
        const Snapshot remote{{"f", file_meta(2, 5000)}};
        const auto upload = compute_plan(local, remote, "/tmp/l", "/r", options_for(SyncDirection::Upload));
        assert(describe(upload) == std::vector<std::string>{"upload f"});
        assert(upload.actions()[0].reason == SyncReason::Modified);

        const auto against = compute_plan(local, remote, "/tmp/l", "/r",
                                          options_for(SyncDirection::Upload, ConflictPolicy::AlwaysDownload));
        assert(describe(against) == std::vector<std::string>{"upload f"});

        const auto download = compute_plan(remote, local, "/tmp/l", "/r", options_for(SyncDirection::Download));
        assert(describe(download) == std::vector<std::string>{"download f"});

        const auto reported = compute_plan(local, remote, "/tmp/l", "/r",
                                           options_for(SyncDirection::Upload, ConflictPolicy::SkipAndReport));
        assert(describe(reported) == std::vector<std::string>{"conflict f"});
    }

    void test_policies()
    {
        const Snapshot local{{"f", file_meta(1, 5000)}};
        const Snapshot remote{{"f", file_meta(2, 1000)}};
        const auto always_download = compute_plan(
            local, remote, "/tmp/l", "/r", options_for(SyncDirection::Bidirectional, ConflictPolicy::AlwaysDownload));
        assert(describe(always_download) == std::vector<std::string>{"download f"});

        const auto skip = compute_plan(local, remote, "/tmp/l", "/r",
                                       options_for(SyncDirection::Bidirectional, ConflictPolicy::SkipAndReport));
        assert(describe(skip) == std::vector<std::string>{"conflict f"});
        assert(skip.summary().conflicts == 1);

        assert(conflict_policy_from_string("skip-and-report") == ConflictPolicy::SkipAndReport);
        assert(to_string(ConflictPolicy::NewerWins) == "newer-wins");
        assert(sync_direction_from_string("bidirectional") == SyncDirection::Bidirectional);
        assert(!sync_direction_from_string("sideways"));
    }

    void test_type_mismatch_blocks_subtree()
    {
        const Snapshot local{{"x", dir_meta()}, {"x/child", file_meta(1, 10)}, {"y", file_meta(1, 10)}};
        const Snapshot remote{{"x", file_meta(4, 10)}};
        const auto plan = compute_plan(local, remote, "/tmp/l", "/r", options_for(SyncDirection::Upload));
        const std::vector<std::string> expected{"upload y", "conflict x"};
        assert(describe(plan) == expected);
    }

    void test_filters()
    {
        SyncOptions options;
        options.exclude = {"build", "*.tmp"};
        options.include = {"*.txt", "src/*.cpp"};
        assert(!sync_path_selected("build", true, options));
        assert(!sync_path_selected("build/a.txt", false, options));
        assert(!sync_path_selected("notes.tmp", false, options));
        assert(sync_path_selected("docs", true, options));
        assert(sync_path_selected("notes.txt", false, options));
        assert(sync_path_selected("src/main.cpp", false, options));
        assert(!sync_path_selected("src/main.hpp", false, options));

        std::vector<LocalEntry> entries;
        entries.push_back(LocalEntry{"build", {}, EntryKind::Directory, 0, 10});
        entries.push_back(LocalEntry{"build/out.txt", {}, EntryKind::File, 3, 10});
        entries.push_back(LocalEntry{"link.txt", {}, EntryKind::Symlink, 0, 10});
        entries.push_back(LocalEntry{"keep.txt", {}, EntryKind::File, 4, 10});
        const auto snapshot = snapshot_local(entries, options);
        assert(snapshot.size() == 1);
        assert(snapshot.count("keep.txt") == 1);
    }

    // Controller over the fake remote, as the shell uses it.
    struct SyncHarness
    {
        explicit SyncHarness(const std::string &name)
            : remote_dir(name + "_remote"),
              local_dir(name + "_local"),
              recorder(events),
              controller(test::fake_factory(remote), events, controller_options())
        {
            remote.root = remote_dir.path();
        }

        static ControllerOptions controller_options()
        {
            ControllerOptions options;
            options.transfers.progress_interval = 0ms;
            options.transfers.backoff_initial = 10ms;
            return options;
        }

        test::TempDir remote_dir;
        test::TempDir local_dir;
        test::FakeRemote remote;
        EventBus events;
        test::EventRecorder recorder;
        Controller controller;
    };

    SyncPayload last_sync_event(const test::EventRecorder &recorder, EventKind kind)
    {
        std::optional<SyncPayload> found;
        for (const auto &event : recorder.events())
        {
            if (event.kind == kind)
            {
                found = std::get<SyncPayload>(event.payload);
            }
        }
        assert(found);
        return *found;
    }

    void test_engine_upload_and_idempotence()
    {
        SyncHarness h("sync_upload");
        test::write_file(h.local_dir / "new.txt", "fresh content");
        test::write_file(h.local_dir / "docs/readme.md", "read me");
        test::set_mtime(h.local_dir / "new.txt", 1700000000);
        const auto profile = test::fake_profile();
        const auto options = options_for(SyncDirection::Upload);

        const auto plan = h.controller.plan_sync(profile, h.local_dir.path(), "/mirror", options);
        const std::vector<std::string> expected{"mkdir-remote docs", "upload docs/readme.md", "upload new.txt"};
        assert(describe(plan) == expected);
        assert(h.recorder.count(EventKind::SyncPlanReady) == 1);

        const auto report = h.controller.apply_sync(profile, plan);
        assert(report.errors.empty());
        assert(report.tasks.size() == 2);
        assert(report.directories_created == 1);
        assert(h.recorder.count(EventKind::SyncStarted) == 1);
        assert(h.recorder.count(EventKind::SyncProgress) == 3);
        assert(h.recorder.count(EventKind::SyncCompleted) == 1);
        assert(h.recorder.count(EventKind::SyncFailed) == 0);
        assert(h.controller.transfers().wait_idle(5s));
        for (const auto id : report.tasks)
        {
            assert(h.controller.transfers().task(id)->state == TransferState::Completed);
        }
        assert(test::read_file(h.remote_dir / "mirror/new.txt") == "fresh content");
        assert(test::read_file(h.remote_dir / "mirror/docs/readme.md") == "read me");
        assert(to_unix_time(std::filesystem::last_write_time(h.remote_dir / "mirror/new.txt")) == 1700000000);

        // Nothing changed since, so the same sync plans nothing.
        const auto again = h.controller.plan_sync(profile, h.local_dir.path(), "/mirror", options);
        assert(again.empty());
        const auto second = h.controller.start_sync(profile, h.local_dir.path(), "/mirror", options);
        assert(second.tasks.empty() && second.deleted == 0 && second.errors.empty());
        assert(h.recorder.count(EventKind::SyncCompleted) == 2);
        assert(h.recorder.count(EventKind::SyncProgress) == 3);
    }

    void test_engine_download_with_deletes()
    {
        SyncHarness h("sync_download");
        test::write_file(h.remote_dir / "site/index.html", "<html/>");
        test::write_file(h.remote_dir / "site/img/logo.png", "png");
        test::write_file(h.local_dir / "stale.txt", "old");
        test::write_file(h.local_dir / "gone/deep.txt", "old");
        const auto profile = test::fake_profile();
        auto options = options_for(SyncDirection::Download);
        options.delete_extraneous = true;

        const auto report = h.controller.start_sync(profile, h.local_dir.path(), "/site", options);
        assert(report.errors.empty());
        assert(report.deleted == 3);
        assert(report.directories_created == 1);
        assert(h.controller.transfers().wait_idle(5s));
        assert(!std::filesystem::exists(h.local_dir / "stale.txt"));
        assert(!std::filesystem::exists(h.local_dir / "gone"));
        assert(test::read_file(h.local_dir / "index.html") == "<html/>");
        assert(test::read_file(h.local_dir / "img/logo.png") == "png");

        const auto again = h.controller.plan_sync(profile, h.local_dir.path(), "/site", options);
        assert(again.empty());
    }

    void test_engine_dry_run_and_conflicts()
    {
        SyncHarness h("sync_dry");
        test::write_file(h.local_dir / "both.txt", "local version");
        test::write_file(h.remote_dir / "r/both.txt", "remote");
        test::set_mtime(h.local_dir / "both.txt", 1000);
        test::set_mtime(h.remote_dir / "r/both.txt", 5000);
        test::write_file(h.local_dir / "only-local.txt", "x");
        const auto profile = test::fake_profile();

        auto dry = options_for(SyncDirection::Upload);
        dry.dry_run = true;
        const auto plan = h.controller.plan_sync(profile, h.local_dir.path(), "/r", dry);
        assert(plan.actions().size() == 2);
        const auto nothing = h.controller.apply_sync(profile, plan);
        assert(nothing.tasks.empty() && nothing.conflicts == 0);
        assert(!std::filesystem::exists(h.remote_dir / "r/only-local.txt"));
        assert(h.recorder.count(EventKind::SyncStarted) == 0);

        const auto report = h.controller.start_sync(
            profile, h.local_dir.path(), "/r", options_for(SyncDirection::Upload, ConflictPolicy::SkipAndReport));
        assert(report.conflicts == 1);
        assert(report.tasks.size() == 1);
        assert(h.recorder.count(EventKind::ConflictDetected) == 1);
        assert(h.controller.transfers().wait_idle(5s));
        assert(test::read_file(h.remote_dir / "r/both.txt") == "remote");
    }

    void test_engine_upload_overwrites_newer_remote()
    {
        SyncHarness h("sync_overwrite");
        test::write_file(h.local_dir / "both.txt", "local version");
        test::write_file(h.remote_dir / "r/both.txt", "remote");
        test::set_mtime(h.local_dir / "both.txt", 1000);
        test::set_mtime(h.remote_dir / "r/both.txt", 5000);
        const auto profile = test::fake_profile();
        const auto options = options_for(SyncDirection::Upload);

        const auto report = h.controller.start_sync(profile, h.local_dir.path(), "/r", options);
        assert(report.conflicts == 0);
        assert(report.tasks.size() == 1);
        assert(h.controller.transfers().wait_idle(5s));
        assert(test::read_file(h.remote_dir / "r/both.txt") == "local version");
        assert(h.recorder.count(EventKind::ConflictDetected) == 0);
        assert(h.controller.plan_sync(profile, h.local_dir.path(), "/r", options).empty());
    }

    void test_engine_reports_failed_actions()
    {
        SyncHarness h("sync_errors");
        test::write_file(h.remote_dir / "r/keep/inner.txt", "excluded");
        test::write_file(h.remote_dir / "r/extra.txt", "extra");
        const auto profile = test::fake_profile();
        std::filesystem::create_directories(h.local_dir.path());

        auto options = options_for(SyncDirection::Upload);
        options.delete_extraneous = true;
        options.exclude = {"keep/*"};
        const auto report = h.controller.start_sync(profile, h.local_dir.path(), "/r", options);
        // "keep" is not empty on the remote, so removing it fails; the rest still runs.
        assert(report.errors.size() == 1);
        assert(report.deleted == 1);
        assert(!std::filesystem::exists(h.remote_dir / "r/extra.txt"));
        assert(std::filesystem::exists(h.remote_dir / "r/keep/inner.txt"));
        assert(h.recorder.count(EventKind::Warning) == 1);

        const auto completed = last_sync_event(h.recorder, EventKind::SyncCompleted);
        assert(completed.profile_id == profile.id);
        assert(completed.remote_root == "/r");
        assert(completed.done == completed.total);
        assert(completed.errors == 1);
    }

    void test_engine_sync_fails_without_session()
    {
        SyncHarness h("sync_offline");
        test::write_file(h.local_dir / "a.txt", "a");
        const auto profile = test::fake_profile();
        const auto options = options_for(SyncDirection::Upload);
        const auto plan = h.controller.plan_sync(profile, h.local_dir.path(), "/r", options);
        assert(!plan.empty());

        h.controller.disconnect(profile.id);
        h.remote.refuse_connect = true;
        bool failed = false;
        try
        {
            (void)h.controller.apply_sync(profile, plan);
        }
        catch (const ConnectionError &)
        {
            failed = true;
        }
        assert(failed);
        assert(h.recorder.count(EventKind::SyncStarted) == 1);
        assert(h.recorder.count(EventKind::SyncCompleted) == 0);
        const auto failure = last_sync_event(h.recorder, EventKind::SyncFailed);
        assert(failure.done == 0);
        assert(failure.total == plan.actions().size());
        assert(!failure.reason.empty());
        assert(!std::filesystem::exists(h.remote_dir / "r/a.txt"));
    }

} // namespace

void run_sync_tests()
{
    test_local_only_file_uploads();
    test_matching_trees_need_nothing();
    test_plan_order();
    test_newer_wins();
    test_one_way_copies_towards_destination();
    test_policies();
    test_type_mismatch_blocks_subtree();
    test_filters();
    test_engine_upload_and_idempotence();
    test_engine_download_with_deletes();
    test_engine_dry_run_and_conflicts();
    test_engine_upload_overwrites_newer_remote();
    test_engine_reports_failed_actions();
    test_engine_sync_fails_without_session();
}
