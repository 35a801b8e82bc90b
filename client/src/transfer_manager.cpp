#include "skiff/client/transfer_manager.hpp"

#include <algorithm>

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

#include "skiff/client/transfer_journal.hpp"
#include "skiff/errors.hpp"

namespace skiff::client
{

    std::chrono::milliseconds retry_delay(const TransferManagerOptions &options, std::uint32_t retry)
    {
        auto delay = options.backoff_initial;
        for (std::uint32_t i = 1; i < retry && delay < options.backoff_max; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, options.backoff_max);
    }

    TransferManager::TransferManager(SessionPool &pool, EventBus &events, TransferManagerOptions options,
                                     TransferJournal *journal, std::shared_ptr<const LocalFileSystem> filesystem)
        : pool_(pool), events_(events), options_(options), journal_(journal), filesystem_(std::move(filesystem)),
          work_(asio::make_work_guard(io_))
    {
        if (!filesystem_)
        {
            filesystem_ = std::make_shared<LocalFileSystem>();
        }
        if (options_.max_concurrent == 0)
        {
            options_.max_concurrent = 1;
        }
        workers_.reserve(options_.max_concurrent);
        for (std::size_t i = 0; i < options_.max_concurrent; ++i)
        {
            workers_.emplace_back([this]
                                  { io_.run(); });
        }
        spdlog::debug("Transfer manager running with {} workers", options_.max_concurrent);
    }

    TransferManager::~TransferManager()
    {
        shutdown();
    }

    TaskId TransferManager::enqueue(TransferRequest request)
    {
        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            if (stopping_)
            {
                throw TransferError("transfer manager is shut down");
            }
            auto record = std::make_unique<Record>();
            record->task.id = next_id_++;
            record->task.direction = request.direction;
            record->task.profile_id = request.profile.id;
            record->task.local_path = std::move(request.local_path);
            record->task.remote_path = std::move(request.remote_path);
            record->task.offset = request.offset;
            record->task.state = TransferState::Queued;
            record->profile = std::move(request.profile);
            snapshot = record->task;
            queue_.push_back(snapshot.id);
            records_.emplace(snapshot.id, std::move(record));
        }
        journal_record(snapshot);
        publish(EventKind::TransferQueued, task_payload(snapshot));
        asio::post(io_, [this]
                   { run_next(); });
        return snapshot.id;
    }

    bool TransferManager::pause(TaskId id)
    {
        TransferTask snapshot;
        bool deferred = false;
        {
            std::lock_guard lock(mutex_);
            auto *record = find(id);
            if (!record)
            {
                return false;
            }
            switch (record->task.state)
            {
            case TransferState::Active:
                record->interrupt = Interrupt::Pause;
                deferred = true;
                break;
            case TransferState::Queued:
                queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
                record->task.state = TransferState::Paused;
                snapshot = record->task;
                break;
            case TransferState::Failed:
                if (!record->task.retry_pending)
                {
                    return false;
                }
                cancel_retry_timer(*record);
                record->task.state = TransferState::Paused;
                snapshot = record->task;
                break;
            default:
                return false;
            }
        }
        if (deferred)
        {
            // The worker finishes the transition at its next chunk boundary.
            pool_.wake_all();
            return true;
        }
        journal_record(snapshot);
        publish(EventKind::TransferPaused, task_payload(snapshot));
        idle_.notify_all();
        return true;
    }

    bool TransferManager::resume(TaskId id)
    {
        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *record = find(id);
            if (!record || record->task.state != TransferState::Paused || stopping_)
            {
                return false;
            }
            push_queued(*record);
            snapshot = record->task;
        }
        publish(EventKind::TransferResumed, task_payload(snapshot));
        asio::post(io_, [this]
                   { run_next(); });
        return true;
    }

    bool TransferManager::cancel(TaskId id)
    {
        TransferTask snapshot;
        bool deferred = false;
        {
            std::lock_guard lock(mutex_);
            auto *record = find(id);
            if (!record)
            {
                return false;
            }
            switch (record->task.state)
            {
            case TransferState::Active:
                record->interrupt = Interrupt::Cancel;
                deferred = true;
                if (record->session)
                {
                    // Do not wait for a stalled read or write to reach the next chunk.
                    record->session->abort_transfer();
                }
                break;
            case TransferState::Queued:
                queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
                record->task.state = TransferState::Cancelled;
                snapshot = record->task;
                break;
            case TransferState::Paused:
                record->task.state = TransferState::Cancelled;
                snapshot = record->task;
                break;
            case TransferState::Failed:
                if (!record->task.retry_pending)
                {
                    return false;
                }
                cancel_retry_timer(*record);
                record->task.state = TransferState::Cancelled;
                snapshot = record->task;
                break;
            default:
                return false;
            }
        }
        if (deferred)
        {
            // The worker finishes the transition at its next chunk boundary.
            pool_.wake_all();
            return true;
        }
        journal_remove(snapshot);
        publish(EventKind::TransferCancelled, task_payload(snapshot));
        idle_.notify_all();
        return true;
    }

    bool TransferManager::retry(TaskId id)
    {
        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            auto *record = find(id);
            if (!record || record->task.state != TransferState::Failed || record->task.retry_pending || stopping_)
            {
                return false;
            }
            record->task.attempts = 0;
            record->task.last_error_kind.reset();
            record->task.last_error.clear();
            push_queued(*record);
            snapshot = record->task;
        }
        journal_record(snapshot);
        publish(EventKind::TransferQueued, task_payload(snapshot));
        asio::post(io_, [this]
                   { run_next(); });
        return true;
    }

    std::optional<TransferTask> TransferManager::task(TaskId id) const
    {
        std::lock_guard lock(mutex_);
        if (const auto *record = find(id))
        {
            return record->task;
        }
        return std::nullopt;
    }

    std::vector<TransferTask> TransferManager::tasks() const
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferTask> result;
        result.reserve(records_.size());
        for (const auto &[id, record] : records_)
        {
            result.push_back(record->task);
        }
        return result;
    }

    TransferStats TransferManager::stats() const
    {
        std::lock_guard lock(mutex_);
        TransferStats stats;
        for (const auto &[id, record] : records_)
        {
            switch (record->task.state)
            {
            case TransferState::Queued:
                ++stats.queued;
                break;
            case TransferState::Active:
                ++stats.active;
                break;
            case TransferState::Paused:
                ++stats.paused;
                break;
            case TransferState::Completed:
                ++stats.completed;
                break;
            case TransferState::Failed:
                if (record->task.retry_pending)
                {
                    ++stats.retrying;
                }
                else
                {
                    ++stats.failed;
                }
                break;
            case TransferState::Cancelled:
                ++stats.cancelled;
                break;
            }
        }
        return stats;
    }

    bool TransferManager::remove(TaskId id)
    {
        std::lock_guard lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end() || !it->second->task.is_terminal())
        {
            return false;
        }
        records_.erase(it);
        spdlog::debug("Transfer {} removed", id);
        return true;
    }

    std::size_t TransferManager::clear_finished()
    {
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();)
        {
            if (it->second->task.is_terminal())
            {
                it = records_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    bool TransferManager::wait_idle(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        return idle_.wait_for(lock, timeout, [this]
                              { return !busy(); });
    }

    std::size_t TransferManager::peak_active() const
    {
        std::lock_guard lock(mutex_);
        return peak_active_;
    }

    void TransferManager::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            if (workers_.empty())
            {
                return;
            }
            stopping_ = true;
            for (auto &[id, record] : records_)
            {
                if (record->task.state == TransferState::Active)
                {
                    record->interrupt = Interrupt::Shutdown;
                }
                else if (record->task.state == TransferState::Failed && record->task.retry_pending)
                {
                    cancel_retry_timer(*record);
                    record->task.state = TransferState::Paused;
                }
            }
        }
        pool_.wake_all();
        work_.reset();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        std::lock_guard lock(mutex_);
        workers_.clear();
        idle_.notify_all();
    }

    void TransferManager::run_next()
    {
        Record *record = nullptr;
        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            if (stopping_)
            {
                return;
            }
            while (!queue_.empty() && !record)
            {
                const auto id = queue_.front();
                queue_.pop_front();
                auto *candidate = find(id);
                if (candidate && candidate->task.state == TransferState::Queued)
                {
                    record = candidate;
                }
            }
            if (!record)
            {
                return;
            }
            record->task.state = TransferState::Active;
            ++record->task.attempts;
            record->interrupt = Interrupt::None;
            record->position = record->task.offset;
            ++active_;
            peak_active_ = std::max(peak_active_, active_);
            snapshot = record->task;
        }
        publish(EventKind::TransferStarted, task_payload(snapshot));
        execute(*record);
    }

    void TransferManager::execute(Record &record)
    {
        std::optional<Attempt> attempt;
        std::optional<std::pair<ErrorKind, std::string>> failure;
        try
        {
            // The lease and any open file are released at the end of this scope,
            // before the task changes state.
            auto lease = pool_.acquire(record.profile, [&record]
                                       { return record.interrupt.load() != Interrupt::None; });
            if (lease)
            {
                struct Attached
                {
                    TransferManager &manager;
                    Record &record;
                    ~Attached()
                    {
                        std::lock_guard lock(manager.mutex_);
                        record.session = nullptr;
                    }
                };
                {
                    std::lock_guard lock(mutex_);
                    record.session = &*lease;
                }
                Attached attached{*this, record};
                attempt = record.task.direction == Direction::Download ? run_download(record, *lease)
                                                                        : run_upload(record, *lease);
            }
        }
        catch (const Error &ex)
        {
            failure.emplace(ex.kind(), ex.what());
        }
        catch (const std::exception &ex)
        {
            failure.emplace(ErrorKind::Internal, ex.what());
        }

        if (failure)
        {
            finish_failed(record, failure->first, failure->second);
            return;
        }
        if (!attempt || !attempt->result.completed)
        {
            finish_interrupted(record, attempt ? attempt->result.final_offset : record.position.load());
            return;
        }

        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            record.task.state = TransferState::Completed;
            record.task.offset = attempt->result.final_offset;
            record.task.total_size = attempt->total_size;
            record.task.retry_pending = false;
            record.task.last_error_kind.reset();
            record.task.last_error.clear();
            snapshot = record.task;
        }
        spdlog::info("Transfer {} {} {} completed ({} bytes)", snapshot.id, to_string(snapshot.direction),
                     snapshot.remote_path, snapshot.total_size);
        journal_remove(snapshot);
        publish(EventKind::TransferProgress, ProgressPayload{snapshot.id, snapshot.offset, snapshot.total_size});
        publish(EventKind::TransferCompleted, task_payload(snapshot));
        release_worker();
    }

    TransferManager::Attempt TransferManager::run_download(Record &record, ProtocolSession &session)
    {
        const auto &remote_path = record.task.remote_path;
        const auto &local_path = record.task.local_path;

        const auto remote = session.stat(remote_path);
        if (!remote)
        {
            throw ProtocolError("remote file " + remote_path + " does not exist");
        }
        if (remote->is_directory())
        {
            throw ProtocolError(remote_path + " is a directory");
        }

        std::uint64_t available = 0;
        if (const auto local = filesystem_->stat(local_path); local && local->kind == EntryKind::File)
        {
            available = local->size;
        }
        const auto offset =
            negotiate_offset(record, session, record.task.offset, std::min(available, remote->size));
        {
            std::lock_guard lock(mutex_);
            record.task.total_size = remote->size;
            record.task.offset = offset;
        }
        record.position = offset;

        Attempt attempt;
        attempt.total_size = remote->size;
        {
            auto sink = filesystem_->open_for_write(local_path, offset);
            attempt.result = session.get(remote_path, sink, offset, make_control(record, remote->size));
            sink.close();
            if (sink.fail())
            {
                throw FileSystemError("cannot finish writing " + local_path.string());
            }
        }
        if (attempt.result.completed && options_.preserve_mtime && remote->modified_time > 0)
        {
            try
            {
                filesystem_->set_modified_time(local_path, remote->modified_time);
            }
            catch (const FileSystemError &ex)
            {
                spdlog::warn("Could not set modification time of {}: {}", local_path.string(), ex.what());
                publish(EventKind::Warning,
                        WarningPayload{record.task.id, "modification time of " + local_path.string() +
                                                           " not preserved: " + ex.what()});
            }
        }
        return attempt;
    }

    TransferManager::Attempt TransferManager::run_upload(Record &record, ProtocolSession &session)
    {
        const auto &remote_path = record.task.remote_path;
        const auto &local_path = record.task.local_path;

        const auto local = filesystem_->stat(local_path);
        if (!local || local->kind != EntryKind::File)
        {
            throw FileSystemError(local_path.string() + " is not a regular file");
        }

        std::uint64_t available = 0;
        if (record.task.offset > 0)
        {
            if (const auto remote = session.stat(remote_path); remote && !remote->is_directory())
            {
                available = remote->size;
            }
        }
        const auto offset = negotiate_offset(record, session, record.task.offset, std::min(available, local->size));
        {
            std::lock_guard lock(mutex_);
            record.task.total_size = local->size;
            record.task.offset = offset;
        }
        record.position = offset;

        Attempt attempt;
        attempt.total_size = local->size;
        {
            auto source = filesystem_->open_for_read(local_path, offset);
            attempt.result = session.put(source, remote_path, offset, make_control(record, local->size));
        }
        if (attempt.result.completed && options_.preserve_mtime)
        {
            try
            {
                if (!session.set_modified_time(remote_path, local->modified_time))
                {
                    spdlog::debug("{} cannot set modification times", record.profile.id);
                }
            }
            catch (const ProtocolError &ex)
            {
                spdlog::warn("Could not set modification time of {}: {}", remote_path, ex.what());
                publish(EventKind::Warning, WarningPayload{record.task.id, "modification time of " + remote_path +
                                                                                " not preserved: " + ex.what()});
            }
        }
        return attempt;
    }

    std::uint64_t TransferManager::negotiate_offset(Record &record, ProtocolSession &session, std::uint64_t requested,
                                                    std::uint64_t available)
    {
        if (requested == 0)
        {
            return 0;
        }
        if (!session.supports_resume())
        {
            const auto message = record.profile.id + " cannot resume " + record.task.remote_path +
                                 ", restarting from zero";
            spdlog::warn("Transfer {}: {}", record.task.id, message);
            publish(EventKind::Warning, WarningPayload{record.task.id, message});
            return 0;
        }
        if (available < requested)
        {
            spdlog::debug("Transfer {}: only {} of {} bytes present, resuming from there", record.task.id, available,
                          requested);
        }
        return std::min(requested, available);
    }

    TransferControl TransferManager::make_control(Record &record, std::uint64_t total_size)
    {
        TransferControl control;
        control.should_stop = [&record]
        {
            return record.interrupt.load() != Interrupt::None;
        };
        control.on_progress = [this, &record, total_size, last = std::chrono::steady_clock::time_point{}](
                                  std::uint64_t position) mutable
        {
            record.position = position;
            const auto now = std::chrono::steady_clock::now();
            if (now - last < options_.progress_interval && position != total_size)
            {
                return;
            }
            last = now;
            TransferTask snapshot;
            {
                std::lock_guard lock(mutex_);
                record.task.offset = position;
                snapshot = record.task;
            }
            journal_record(snapshot);
            publish(EventKind::TransferProgress, ProgressPayload{snapshot.id, position, total_size});
        };
        return control;
    }

    void TransferManager::finish_interrupted(Record &record, std::uint64_t offset)
    {
        const auto interrupt = record.interrupt.load();
        TransferTask snapshot;
        {
            std::lock_guard lock(mutex_);
            record.task.offset = offset;
            record.task.retry_pending = false;
            record.task.state = interrupt == Interrupt::Cancel ? TransferState::Cancelled : TransferState::Paused;
            snapshot = record.task;
        }
        if (snapshot.state == TransferState::Cancelled)
        {
            spdlog::info("Transfer {} cancelled at {} bytes", snapshot.id, offset);
            journal_remove(snapshot);
            publish(EventKind::TransferCancelled, task_payload(snapshot));
        }
        else
        {
            spdlog::info("Transfer {} paused at {} bytes", snapshot.id, offset);
            journal_record(snapshot);
            publish(EventKind::TransferPaused, task_payload(snapshot));
        }
        release_worker();
    }

    void TransferManager::finish_failed(Record &record, ErrorKind kind, const std::string &reason)
    {
        if (record.interrupt.load() != Interrupt::None)
        {
            // The failure was most likely caused by the interrupt itself.
            spdlog::debug("Transfer {} stopped with: {}", record.task.id, reason);
            finish_interrupted(record, record.position.load());
            return;
        }

        TransferTask snapshot;
        std::uint32_t retry_number = 0;
        std::chrono::milliseconds delay{};
        {
            std::lock_guard lock(mutex_);
            record.task.state = TransferState::Failed;
            record.task.offset = record.position.load();
            record.task.last_error_kind = kind;
            record.task.last_error = reason;

            const auto retries_used = record.task.attempts > 0 ? record.task.attempts - 1 : 0;
            if (is_retryable(kind) && retries_used < options_.max_retries && !stopping_)
            {
                retry_number = retries_used + 1;
                delay = retry_delay(options_, retry_number);
                record.task.retry_pending = true;
                record.retry_timer = std::make_unique<asio::steady_timer>(io_, delay);
                record.retry_timer->async_wait([this, id = record.task.id](const std::error_code &ec)
                                               {
                                                   if (!ec)
                                                   {
                                                       on_retry_timer(id);
                                                   } });
            }
            else
            {
                record.task.retry_pending = false;
            }
            snapshot = record.task;
        }

        if (snapshot.retry_pending)
        {
            spdlog::warn("Transfer {} failed ({}: {}), retry {} in {} ms", snapshot.id, to_string(kind), reason,
                         retry_number, delay.count());
            journal_record(snapshot);
            publish(EventKind::TransferRetrying, RetryPayload{snapshot.id, retry_number, delay, kind, reason});
        }
        else
        {
            spdlog::error("Transfer {} failed after {} attempt(s): {}: {}", snapshot.id, snapshot.attempts,
                          to_string(kind), reason);
            journal_remove(snapshot);
            publish(EventKind::TransferFailed, FailurePayload{snapshot.id, kind, reason, snapshot.attempts});
        }
        release_worker();
    }

    // The worker counts as busy until its terminal events are out, so wait_idle()
    // callers observe them.
    void TransferManager::release_worker()
    {
        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        idle_.notify_all();
    }

    void TransferManager::on_retry_timer(TaskId id)
    {
        {
            std::lock_guard lock(mutex_);
            auto *record = find(id);
            if (!record || stopping_ || record->task.state != TransferState::Failed || !record->task.retry_pending)
            {
                return;
            }
            push_queued(*record);
        }
        run_next();
    }

    void TransferManager::push_queued(Record &record)
    {
        record.task.state = TransferState::Queued;
        record.task.retry_pending = false;
        record.interrupt = Interrupt::None;
        queue_.push_back(record.task.id);
    }

    void TransferManager::cancel_retry_timer(Record &record)
    {
        if (record.retry_timer)
        {
            record.retry_timer->cancel();
        }
        record.task.retry_pending = false;
    }

    TransferManager::Record *TransferManager::find(TaskId id)
    {
        const auto it = records_.find(id);
        return it == records_.end() ? nullptr : it->second.get();
    }

    const TransferManager::Record *TransferManager::find(TaskId id) const
    {
        const auto it = records_.find(id);
        return it == records_.end() ? nullptr : it->second.get();
    }

    bool TransferManager::busy() const
    {
        if (active_ > 0)
        {
            return true;
        }
        return std::any_of(records_.begin(), records_.end(), [](const auto &entry)
                           { return entry.second->task.state == TransferState::Queued || entry.second->task.retry_pending; });
    }

    void TransferManager::publish(EventKind kind, EventPayload payload) const
    {
        events_.publish(Event{kind, std::move(payload)});
    }

    TaskPayload TransferManager::task_payload(const TransferTask &task) const
    {
        return TaskPayload{task.id, task.direction, task.local_path.string(), task.remote_path, task.offset};
    }

    void TransferManager::journal_record(const TransferTask &task) const
    {
        if (journal_)
        {
            journal_->record(task);
        }
    }

    void TransferManager::journal_remove(const TransferTask &task) const
    {
        if (journal_)
        {
            journal_->remove(task);
        }
    }

} // namespace skiff::client
