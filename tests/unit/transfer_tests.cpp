#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "skiff/client/session_pool.hpp"
#include "skiff/client/transfer_journal.hpp"
#include "skiff/client/transfer_manager.hpp"
#include "skiff/client/transfer_task.hpp"

#include "test_support.hpp"

using namespace skiff;
using namespace skiff::client;
using namespace std::chrono_literals;

namespace
{

    TransferManagerOptions fast_options(std::size_t concurrency = 3)
    {
        TransferManagerOptions options;
        options.max_concurrent = concurrency;
        options.max_retries = 3;
        options.backoff_initial = 10ms;
        options.backoff_max = 40ms;
        options.progress_interval = 0ms;
        return options;
    }

    // Remote tree, bus, pool and manager wired together the way the controller does it.
    struct Harness
    {
        explicit Harness(const std::string &name, TransferManagerOptions options = fast_options(),
                         std::size_t sessions = 2, TransferJournal *journal = nullptr,
                         std::shared_ptr<const LocalFileSystem> filesystem = nullptr)
            : remote_dir(name + "_remote"),
              local_dir(name + "_local"),
              remote(),
              recorder(events),
              pool(test::fake_factory(remote), sessions, events),
              manager(pool, events, options, journal, std::move(filesystem))
        {
            remote.root = remote_dir.path();
        }

        ~Harness()
        {
            manager.shutdown();
            pool.close_all();
        }

        TransferState state(TaskId id) const { return manager.task(id)->state; }

        bool wait_for(TaskId id, TransferState wanted, std::chrono::milliseconds timeout = 5000ms)
        {
            return test::wait_until([&]
                                    { return state(id) == wanted; },
                                    timeout);
        }

        TaskId download(const std::string &remote_path, const std::filesystem::path &local_path,
                        std::uint64_t offset = 0)
        {
            return manager.enqueue(
                TransferRequest{Direction::Download, test::fake_profile(), local_path, remote_path, offset});
        }

        TaskId upload(const std::filesystem::path &local_path, const std::string &remote_path)
        {
            return manager.enqueue(TransferRequest{Direction::Upload, test::fake_profile(), local_path, remote_path, 0});
        }

        test::TempDir remote_dir;
        test::TempDir local_dir;
        test::FakeRemote remote;
        EventBus events;
        test::EventRecorder recorder;
        SessionPool pool;
        TransferManager manager;
    };

    // Local disk that refuses to change timestamps, like a filesystem mounted without utime support.
    class FrozenTimesFileSystem final : public LocalFileSystem
    {
    public:
        void set_modified_time(const std::filesystem::path &path, std::int64_t) const override
        {
            throw FileSystemError("cannot set modification time of " + path.string() + ": operation not permitted");
        }
    };

    void test_retry_delay()
    {
        TransferManagerOptions options;
        assert(retry_delay(options, 1) == 1000ms);
        assert(retry_delay(options, 2) == 2000ms);
        assert(retry_delay(options, 3) == 4000ms);
        assert(retry_delay(options, 5) == 16000ms);
        assert(retry_delay(options, 6) == 30000ms);
        assert(retry_delay(options, 40) == 30000ms);
    }

    void test_transfer_state_names()
    {
        assert(to_string(TransferState::Active) == "active");
        assert(transfer_state_from_string("cancelled") == TransferState::Cancelled);
        assert(!transfer_state_from_string("done"));

        TransferTask task;
        task.state = TransferState::Failed;
        task.retry_pending = true;
        assert(!task.is_terminal());
        task.retry_pending = false;
        assert(task.is_terminal());
    }

    void test_session_pool_limits()
    {
        test::TempDir root("pool");
        test::FakeRemote remote;
        remote.root = root.path();
        EventBus events;
        test::EventRecorder recorder(events);
        SessionPool pool(test::fake_factory(remote), 2, events);
        const auto profile = test::fake_profile();

        {
            auto first = pool.acquire(profile);
            auto second = pool.acquire(profile);
            assert(first && second);
            assert(pool.in_use(profile.id) == 2);
            assert(remote.connects == 2);

            // A third caller waits until a lease comes back.
            auto waiter = std::async(std::launch::async, [&]
                                     { return pool.acquire(profile); });
            assert(waiter.wait_for(50ms) == std::future_status::timeout);
            first.release();
            auto third = waiter.get();
            assert(third);
            assert(pool.in_use(profile.id) == 2);
            // The released session was reused rather than reconnected.
            assert(remote.connects == 2);

            // An aborted wait returns an empty lease.
            const auto aborted = pool.acquire(profile, []
                                              { return true; });
            assert(!aborted);

            third.discard();
        }
        assert(pool.in_use(profile.id) == 0);
        assert(pool.idle(profile.id) == 1);
        assert(remote.open_sessions == 1);

        pool.close_profile(profile.id);
        assert(pool.idle(profile.id) == 0);
        assert(remote.open_sessions == 0);
        assert(recorder.count(EventKind::Connected) == 2);
        assert(recorder.count(EventKind::Disconnected) == 2);

        // A failed connect frees its slot.
        remote.refuse_connect = true;
        bool refused = false;
        try
        {
            (void)pool.acquire(profile);
        }
        catch (const ConnectionError &)
        {
            refused = true;
        }
        assert(refused);
        assert(pool.in_use(profile.id) == 0);
        remote.refuse_connect = false;
        assert(pool.acquire(profile));
        pool.close_all();
        assert(remote.open_sessions == 0);
    }

    void test_concurrency_bound()
    {
        Harness h("concurrency", fast_options(3), 4);
        h.remote.chunk_delay = 2ms;
        std::vector<TaskId> ids;
        for (int i = 0; i < 8; ++i)
        {
            const auto name = "file" + std::to_string(i) + ".bin";
            test::write_file(h.remote_dir / name, test::make_content(160, static_cast<char>('a' + i)));
            ids.push_back(h.download("/" + name, h.local_dir / name));
        }
        assert(h.manager.wait_idle(10s));
        for (int i = 0; i < 8; ++i)
        {
            const auto name = "file" + std::to_string(i) + ".bin";
            assert(h.state(ids[i]) == TransferState::Completed);
            assert(test::read_file(h.local_dir / name) == test::make_content(160, static_cast<char>('a' + i)));
            assert(h.recorder.count(EventKind::TransferCompleted, ids[i]) == 1);
        }
        assert(h.manager.peak_active() <= 3);
        assert(h.manager.peak_active() >= 2);
        assert(h.remote.peak_in_flight <= 3);
        assert(h.pool.in_use(test::fake_profile().id) == 0);
        const auto stats = h.manager.stats();
        assert(stats.completed == 8 && stats.total() == 8);
    }

    void test_fifo_order_with_single_worker()
    {
        Harness h("fifo", fast_options(1));
        std::vector<TaskId> ids;
        for (int i = 0; i < 4; ++i)
        {
            const auto name = "n" + std::to_string(i);
            test::write_file(h.remote_dir / name, "x");
            ids.push_back(h.download("/" + name, h.local_dir / name));
        }
        assert(h.manager.wait_idle(5s));
        std::vector<TaskId> started;
        for (const auto &event : h.recorder.events())
        {
            if (event.kind == EventKind::TransferStarted)
            {
                started.push_back(std::get<TaskPayload>(event.payload).task);
            }
        }
        assert(started == ids);
        assert(h.manager.peak_active() == 1);
    }

    void test_pause_resume_download()
    {
        Harness h("pause_download");
        h.remote.chunk_delay = 2ms;
        const auto content = test::make_content(4000);
        test::write_file(h.remote_dir / "big.bin", content);

        const auto id = h.download("/big.bin", h.local_dir / "big.bin");
        assert(test::wait_until([&]
                                { return h.recorder.count(EventKind::TransferProgress, id) > 2; }));
        assert(h.manager.pause(id));
        assert(h.wait_for(id, TransferState::Paused));

        const auto paused = *h.manager.task(id);
        assert(paused.offset > 0 && paused.offset < content.size());
        assert(std::filesystem::file_size(h.local_dir / "big.bin") == paused.offset);
        assert(h.recorder.count(EventKind::TransferPaused, id) == 1);
        assert(h.pool.in_use(test::fake_profile().id) == 0);

        assert(!h.manager.pause(id));
        assert(h.manager.resume(id));
        assert(h.manager.wait_idle(10s));
        assert(h.state(id) == TransferState::Completed);
        assert(h.recorder.count(EventKind::TransferResumed, id) == 1);
        assert(test::read_file(h.local_dir / "big.bin") == content);
        assert(h.recorder.count(EventKind::Warning) == 0);
    }

    void test_pause_resume_upload()
    {
        Harness h("pause_upload");
        h.remote.chunk_delay = 2ms;
        const auto content = test::make_content(4000, 'A');
        test::write_file(h.local_dir / "up.bin", content);

        const auto id = h.upload(h.local_dir / "up.bin", "/up.bin");
        assert(test::wait_until([&]
                                { return h.recorder.count(EventKind::TransferProgress, id) > 2; }));
        assert(h.manager.pause(id));
        assert(h.wait_for(id, TransferState::Paused));
        const auto offset = h.manager.task(id)->offset;
        assert(offset > 0 && offset < content.size());
        assert(std::filesystem::file_size(h.remote_dir / "up.bin") == offset);

        assert(h.manager.resume(id));
        assert(h.manager.wait_idle(10s));
        assert(h.state(id) == TransferState::Completed);
        assert(test::read_file(h.remote_dir / "up.bin") == content);
    }

    void test_resume_without_server_support_restarts()
    {
        Harness h("no_resume");
        h.remote.resume = false;
        h.remote.chunk_delay = 2ms;
        const auto content = test::make_content(3000);
        test::write_file(h.remote_dir / "r.bin", content);

        const auto id = h.download("/r.bin", h.local_dir / "r.bin");
        assert(test::wait_until([&]
                                { return h.recorder.count(EventKind::TransferProgress, id) > 2; }));
        assert(h.manager.pause(id));
        assert(h.wait_for(id, TransferState::Paused));
        assert(h.manager.resume(id));
        assert(h.manager.wait_idle(10s));
        assert(h.state(id) == TransferState::Completed);
        assert(h.recorder.count(EventKind::Warning, id) == 1);
        assert(test::read_file(h.local_dir / "r.bin") == content);
    }

    void test_download_survives_timestamp_failure()
    {
        Harness h("frozen_times", fast_options(), 2, nullptr, std::make_shared<FrozenTimesFileSystem>());
        const auto content = test::make_content(500);
        test::write_file(h.remote_dir / "t.bin", content);

        const auto id = h.download("/t.bin", h.local_dir / "t.bin");
        assert(h.manager.wait_idle(10s));
        assert(h.state(id) == TransferState::Completed);
        assert(h.manager.task(id)->attempts == 1);
        assert(test::read_file(h.local_dir / "t.bin") == content);
        assert(h.recorder.count(EventKind::TransferCompleted, id) == 1);
        assert(h.recorder.count(EventKind::TransferFailed, id) == 0);
        assert(h.recorder.count(EventKind::Warning, id) == 1);
    }

    void test_retry_cap_and_manual_retry()
    {
        auto options = fast_options();
        options.max_retries = 2;
        Harness h("retry_cap", options);
        test::write_file(h.remote_dir / "flaky.bin", test::make_content(64));
        h.remote.failures = 1000;

        const auto id = h.download("/flaky.bin", h.local_dir / "flaky.bin");
        assert(h.manager.wait_idle(5s));
        const auto failed = *h.manager.task(id);
        assert(failed.state == TransferState::Failed);
        assert(!failed.retry_pending);
        assert(failed.attempts == 3);
        assert(failed.last_error_kind == ErrorKind::Transfer);
        assert(h.recorder.count(EventKind::TransferRetrying, id) == 2);
        assert(h.recorder.count(EventKind::TransferFailed, id) == 1);
        assert(h.manager.stats().failed == 1);

        // Delays grow between attempts.
        std::vector<std::chrono::milliseconds> delays;
        for (const auto &event : h.recorder.events())
        {
            if (event.kind == EventKind::TransferRetrying)
            {
                delays.push_back(std::get<RetryPayload>(event.payload).delay);
            }
        }
        assert(delays.size() == 2 && delays[0] == 10ms && delays[1] == 20ms);

        h.remote.failures = 0;
        assert(h.manager.retry(id));
        assert(h.manager.wait_idle(5s));
        assert(h.state(id) == TransferState::Completed);
        assert(h.manager.task(id)->attempts == 1);
        assert(!h.manager.retry(id));
    }

    void test_transient_failure_recovers()
    {
        Harness h("transient");
        test::write_file(h.remote_dir / "once.bin", test::make_content(64));
        h.remote.failures = 1;
        const auto id = h.download("/once.bin", h.local_dir / "once.bin");
        assert(h.manager.wait_idle(5s));
        assert(h.state(id) == TransferState::Completed);
        assert(h.manager.task(id)->attempts == 2);
        assert(h.recorder.count(EventKind::TransferRetrying, id) == 1);
        assert(test::read_file(h.local_dir / "once.bin") == test::make_content(64));
    }

    void test_permanent_failure_is_not_retried()
    {
        Harness h("permanent");
        const auto id = h.download("/does-not-exist", h.local_dir / "x");
        assert(h.manager.wait_idle(5s));
        const auto task = *h.manager.task(id);
        assert(task.state == TransferState::Failed);
        assert(task.attempts == 1);
        assert(task.last_error_kind == ErrorKind::Protocol);
        assert(h.recorder.count(EventKind::TransferRetrying) == 0);

        const auto upload = h.upload(h.local_dir / "missing-local", "/y");
        assert(h.manager.wait_idle(5s));
        assert(h.manager.task(upload)->last_error_kind == ErrorKind::FileSystem);
    }

    void test_cancel_cycles_release_sessions()
    {
        Harness h("cancel_cycles", fast_options(2), 2);
        h.remote.chunk_delay = 2ms;
        test::write_file(h.remote_dir / "slow.bin", test::make_content(4000));
        const auto profile_id = test::fake_profile().id;

        for (int cycle = 0; cycle < 10; ++cycle)
        {
            const auto id = h.download("/slow.bin", h.local_dir / ("slow" + std::to_string(cycle)));
            assert(h.wait_for(id, TransferState::Active));
            assert(h.manager.cancel(id));
            assert(h.wait_for(id, TransferState::Cancelled));
            assert(!h.manager.cancel(id));
            assert(!h.manager.resume(id));
        }
        assert(h.manager.wait_idle(5s));
        assert(h.pool.in_use(profile_id) == 0);
        assert(h.remote.open_sessions <= 2);
        assert(h.manager.stats().cancelled == 10);
        assert(h.manager.clear_finished() == 10);
        assert(h.manager.tasks().empty());
    }

    void test_cancel_queued_and_retrying()
    {
        auto options = fast_options(1);
        options.backoff_initial = 2000ms;
        options.backoff_max = 2000ms;
        Harness h("cancel_queued", options);
        h.remote.chunk_delay = 2ms;
        test::write_file(h.remote_dir / "slow.bin", test::make_content(4000));

        const auto running = h.download("/slow.bin", h.local_dir / "a");
        const auto queued = h.download("/slow.bin", h.local_dir / "b");
        assert(h.wait_for(running, TransferState::Active));
        assert(h.state(queued) == TransferState::Queued);
        assert(h.manager.cancel(queued));
        assert(h.state(queued) == TransferState::Cancelled);
        assert(h.recorder.count(EventKind::TransferCancelled, queued) == 1);

        // A queued task can also be paused and resumed later.
        const auto later = h.download("/slow.bin", h.local_dir / "c");
        assert(h.manager.pause(later));
        assert(h.state(later) == TransferState::Paused);
        assert(h.manager.cancel(later));
        assert(h.state(later) == TransferState::Cancelled);

        assert(h.manager.cancel(running));
        assert(h.wait_for(running, TransferState::Cancelled));

        // Cancelling while a retry is scheduled takes effect immediately.
        h.remote.failures = 1;
        const auto flaky = h.download("/slow.bin", h.local_dir / "d");
        assert(test::wait_until([&]
                                { return h.manager.task(flaky)->retry_pending; }));
        assert(h.manager.cancel(flaky));
        assert(h.state(flaky) == TransferState::Cancelled);
        assert(h.manager.wait_idle(1s));
    }

    void test_cancel_breaks_stalled_read()
    {
        Harness h("stalled_cancel");
        h.remote.stall = 20s;
        test::write_file(h.remote_dir / "stuck.bin", test::make_content(400));

        const auto id = h.download("/stuck.bin", h.local_dir / "stuck.bin");
        assert(test::wait_until([&]
                                { return h.recorder.count(EventKind::TransferProgress, id) > 0; }));
        const auto cancelled_at = std::chrono::steady_clock::now();
        assert(h.manager.cancel(id));
        assert(h.wait_for(id, TransferState::Cancelled));
        assert(std::chrono::steady_clock::now() - cancelled_at < 5s);
        assert(h.remote.aborts == 1);
        assert(h.manager.wait_idle(5s));
        assert(h.recorder.count(EventKind::TransferCancelled, id) == 1);
        assert(h.recorder.count(EventKind::TransferRetrying, id) == 0);
        assert(h.recorder.count(EventKind::TransferFailed, id) == 0);
        assert(h.pool.in_use(test::fake_profile().id) == 0);
    }

    void test_remove_only_finished_tasks()
    {
        Harness h("remove_task");
        h.remote.chunk_delay = 2ms;
        test::write_file(h.remote_dir / "small.bin", test::make_content(40));
        test::write_file(h.remote_dir / "big.bin", test::make_content(4000));

        const auto done = h.download("/small.bin", h.local_dir / "small.bin");
        assert(h.wait_for(done, TransferState::Completed));
        const auto running = h.download("/big.bin", h.local_dir / "big.bin");
        assert(h.wait_for(running, TransferState::Active));

        assert(!h.manager.remove(running));
        assert(!h.manager.remove(999));
        assert(h.manager.remove(done));
        assert(!h.manager.task(done));
        assert(!h.manager.remove(done));

        assert(h.manager.cancel(running));
        assert(h.wait_for(running, TransferState::Cancelled));
        assert(h.manager.remove(running));
        assert(h.manager.tasks().empty());
        // Removing a task leaves the file it produced alone.
        assert(test::read_file(h.local_dir / "small.bin") == test::make_content(40));
    }

    void test_journal_tracks_unfinished_work()
    {
        test::TempDir dir("journal");
        const auto path = dir / "state" / "transfers.json";
        {
            TransferJournal journal(path);
            assert(journal.entries().empty());

            TransferTask task;
            task.direction = Direction::Upload;
            task.profile_id = "sftp://a@h:22";
            task.local_path = dir / "x.bin";
            task.remote_path = "/x.bin";
            task.total_size = 100;
            task.offset = 10;
            journal.record(task);
            task.offset = 40;
            journal.record(task);

            TransferTask other = task;
            other.profile_id = "ftp://b@h:21";
            journal.record(other);

            assert(journal.entries().size() == 2);
            const auto pending = journal.pending_for_profile("sftp://a@h:22");
            assert(pending.size() == 1);
            assert(pending[0].offset == 40);
            assert(pending[0].total_size == 100);
        }
        {
            TransferJournal reloaded(path);
            assert(reloaded.entries().size() == 2);
            reloaded.discard_profile("ftp://b@h:21");
            assert(reloaded.pending_for_profile("ftp://b@h:21").empty());

            TransferTask task;
            task.direction = Direction::Upload;
            task.profile_id = "sftp://a@h:22";
            task.local_path = dir / "x.bin";
            task.remote_path = "/x.bin";
            reloaded.remove(task);
            assert(reloaded.entries().empty());
        }

        std::ofstream(path, std::ios::trunc) << "{ not json";
        TransferJournal malformed(path);
        assert(malformed.entries().empty());
    }

    void test_manager_writes_journal()
    {
        test::TempDir dir("manager_journal");
        TransferJournal journal(dir / "transfers.json");
        Harness h("manager_journal", fast_options(), 2, &journal);
        h.remote.chunk_delay = 2ms;
        test::write_file(h.remote_dir / "j.bin", test::make_content(4000));

        const auto id = h.download("/j.bin", h.local_dir / "j.bin");
        assert(test::wait_until([&]
                                { return h.recorder.count(EventKind::TransferProgress, id) > 2; }));
        assert(h.manager.pause(id));
        assert(h.wait_for(id, TransferState::Paused));
        const auto pending = journal.pending_for_profile(test::fake_profile().id);
        assert(pending.size() == 1);
        assert(pending[0].offset == h.manager.task(id)->offset);

        assert(h.manager.resume(id));
        assert(h.manager.wait_idle(10s));
        assert(journal.entries().empty());
    }

    void test_shutdown_pauses_active_work()
    {
        test::TempDir dir("shutdown_journal");
        TransferJournal journal(dir / "transfers.json");
        Harness h("shutdown", fast_options(), 2, &journal);
        h.remote.chunk_delay = 2ms;
        test::write_file(h.remote_dir / "s.bin", test::make_content(4000));

        const auto id = h.download("/s.bin", h.local_dir / "s.bin");
        assert(h.wait_for(id, TransferState::Active));
        h.manager.shutdown();
        assert(h.state(id) == TransferState::Paused);
        assert(journal.entries().size() == 1);
        assert(!h.manager.resume(id));

        bool rejected = false;
        try
        {
            (void)h.download("/s.bin", h.local_dir / "again");
        }
        catch (const TransferError &)
        {
            rejected = true;
        }
        assert(rejected);
    }

} // namespace

void run_transfer_tests()
{
    test_retry_delay();
    test_transfer_state_names();
    test_session_pool_limits();
    test_concurrency_bound();
    test_fifo_order_with_single_worker();
    test_pause_resume_download();
    test_pause_resume_upload();
    test_resume_without_server_support_restarts();
    test_download_survives_timestamp_failure();
    test_retry_cap_and_manual_retry();
    test_transient_failure_recovers();
    test_permanent_failure_is_not_retried();
    test_cancel_cycles_release_sessions();
    test_cancel_queued_and_retrying();
    test_cancel_breaks_stalled_read();
    test_remove_only_finished_tasks();
    test_journal_tracks_unfinished_work();
    test_manager_writes_journal();
    test_shutdown_pauses_active_work();
}
