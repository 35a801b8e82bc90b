#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "skiff/client/local_filesystem.hpp"
#include "skiff/client/session_pool.hpp"
#include "skiff/client/transfer_task.hpp"
#include "skiff/events.hpp"

namespace skiff::client
{

    class TransferJournal;

    struct TransferManagerOptions
    {
        std::size_t max_concurrent{3};
        // Automatic retries after the first attempt.
        std::uint32_t max_retries{3};
        std::chrono::milliseconds backoff_initial{1000};
        std::chrono::milliseconds backoff_max{30000};
        std::chrono::milliseconds progress_interval{250};
        bool preserve_mtime{true};
    };

    // Delay before automatic retry number `retry` (1-based): initial * 2^(retry-1), capped.
    std::chrono::milliseconds retry_delay(const TransferManagerOptions &options, std::uint32_t retry);

    /**
     * FIFO transfer queue drained by a fixed pool of worker threads running an
     * asio io_context. Exactly one run_next() is posted per queue insertion, so
     * no more than max_concurrent tasks are ever Active. Tasks live in a map
     * keyed by id; only the worker executing a task changes its offset.
     *
     * Pause is cooperative and lands on a chunk boundary. Cancel stops at the
     * next chunk boundary too, or immediately when the task is waiting for a
     * session or a retry.
     */
    class TransferManager
    {
    public:
        TransferManager(SessionPool &pool, EventBus &events, TransferManagerOptions options = {},
                        TransferJournal *journal = nullptr,
                        std::shared_ptr<const LocalFileSystem> filesystem = nullptr);
        ~TransferManager();

        TransferManager(const TransferManager &) = delete;
        TransferManager &operator=(const TransferManager &) = delete;

        TaskId enqueue(TransferRequest request);

        // Each returns false when the task does not exist or is in the wrong state.
        bool pause(TaskId id);
        bool resume(TaskId id);
        bool cancel(TaskId id);
        // Re-queues a terminally failed task with a fresh attempt counter.
        bool retry(TaskId id);

        std::optional<TransferTask> task(TaskId id) const;
        std::vector<TransferTask> tasks() const;
        TransferStats stats() const;

        // Forgets one completed, cancelled or terminally failed task. Live tasks
        // must be cancelled first.
        bool remove(TaskId id);
        // Drops completed, cancelled and terminally failed tasks. Returns how many.
        std::size_t clear_finished();

        // True once nothing is queued, active or waiting for a retry.
        bool wait_idle(std::chrono::milliseconds timeout);

        // Highest number of simultaneously Active tasks observed.
        std::size_t peak_active() const;

        // Interrupts active tasks (they end Paused), drops pending work and joins the workers.
        void shutdown();

    private:
        enum class Interrupt : std::uint8_t
        {
            None,
            Pause,
            Cancel,
            Shutdown
        };

        struct Record
        {
            TransferTask task;
            ConnectionProfile profile;
            std::atomic<Interrupt> interrupt{Interrupt::None};
            // Position reached by the running attempt.
            std::atomic<std::uint64_t> position{0};
            std::unique_ptr<asio::steady_timer> retry_timer;
            // Session the running attempt holds, guarded by mutex_.
            ProtocolSession *session{nullptr};
        };

        struct Attempt
        {
            TransferResult result;
            std::uint64_t total_size{};
        };

        void run_next();
        void execute(Record &record);
        Attempt run_download(Record &record, ProtocolSession &session);
        Attempt run_upload(Record &record, ProtocolSession &session);
        std::uint64_t negotiate_offset(Record &record, ProtocolSession &session, std::uint64_t requested,
                                       std::uint64_t available);
        TransferControl make_control(Record &record, std::uint64_t total_size);

        void finish_interrupted(Record &record, std::uint64_t offset);
        void finish_failed(Record &record, ErrorKind kind, const std::string &reason);
        void release_worker();
        void on_retry_timer(TaskId id);

        void push_queued(Record &record);
        void cancel_retry_timer(Record &record);
        Record *find(TaskId id);
        const Record *find(TaskId id) const;
        bool busy() const;

        void publish(EventKind kind, EventPayload payload) const;
        TaskPayload task_payload(const TransferTask &task) const;
        void journal_record(const TransferTask &task) const;
        void journal_remove(const TransferTask &task) const;

        SessionPool &pool_;
        EventBus &events_;
        TransferManagerOptions options_;
        TransferJournal *journal_;
        std::shared_ptr<const LocalFileSystem> filesystem_;

        asio::io_context io_;
        asio::executor_work_guard<asio::io_context::executor_type> work_;
        std::vector<std::thread> workers_;

        mutable std::mutex mutex_;
        std::condition_variable idle_;
        std::map<TaskId, std::unique_ptr<Record>> records_;
        std::deque<TaskId> queue_;
        TaskId next_id_{1};
        std::size_t active_{0};
        std::size_t peak_active_{0};
        bool stopping_{false};
    };

} // namespace skiff::client
