#include "skiff/client/protocol_session.hpp"

#include <spdlog/spdlog.h>

#include "skiff/errors.hpp"

namespace skiff::client
{

    ProtocolSession::ProtocolSession(ConnectionProfile profile) : profile_(std::move(profile)) {}

    template <typename Operation>
    auto ProtocolSession::run(const char *name, Operation &&operation)
    {
        std::lock_guard lock(mutex_);
        if (!connected_.load())
        {
            throw ConnectionError(std::string(name) + ": not connected to " + profile_.host);
        }
        try
        {
            return operation();
        }
        catch (const ConnectionError &ex)
        {
            // The wire state is unknown after a transport failure; the session is unusable.
            spdlog::warn("{} on {} failed, dropping connection: {}", name, profile_.id, ex.what());
            mark_connected(false);
            do_close();
            throw;
        }
    }

    void ProtocolSession::connect()
    {
        std::lock_guard lock(mutex_);
        if (connected_.load())
        {
            return;
        }
        spdlog::info("Connecting to {}", display_url(profile_));
        try
        {
            do_connect();
        }
        catch (const std::exception &)
        {
            do_close();
            throw;
        }
        mark_connected(true);
        spdlog::info("Connected to {}", profile_.id);
    }

    Listing ProtocolSession::list(const std::string &path)
    {
        const auto target = resolve(path);
        return run("list", [&]
                   { return do_list(target); });
    }

    TransferResult ProtocolSession::get(const std::string &remote_path, std::ostream &sink, std::uint64_t offset,
                                        const TransferControl &control)
    {
        const auto target = resolve(remote_path);
        return run("get", [&]
                   { return do_get(target, sink, offset, control); });
    }

    TransferResult ProtocolSession::put(std::istream &source, const std::string &remote_path, std::uint64_t offset,
                                        const TransferControl &control)
    {
        const auto target = resolve(remote_path);
        return run("put", [&]
                   { return do_put(source, target, offset, control); });
    }

    void ProtocolSession::mkdir(const std::string &path)
    {
        const auto target = resolve(path);
        run("mkdir", [&]
            {
                try
                {
                    do_mkdir(target);
                }
                catch (const ProtocolError &)
                {
                    const auto existing = do_stat(target);
                    if (existing && existing->is_directory())
                    {
                        return;
                    }
                    throw;
                } });
    }

    void ProtocolSession::remove(const std::string &path, EntryKind kind)
    {
        const auto target = resolve(path);
        run("remove", [&]
            {
                try
                {
                    do_remove(target, kind);
                }
                catch (const ProtocolError &)
                {
                    if (!do_stat(target))
                    {
                        return;
                    }
                    throw;
                } });
    }

    void ProtocolSession::rename(const std::string &from, const std::string &to)
    {
        const auto source = resolve(from);
        const auto destination = resolve(to);
        run("rename", [&]
            {
                try
                {
                    do_rename(source, destination);
                }
                catch (const ProtocolError &)
                {
                    if (!do_stat(source) && do_stat(destination))
                    {
                        return;
                    }
                    throw;
                } });
    }

    std::optional<RemoteEntry> ProtocolSession::stat(const std::string &path)
    {
        const auto target = resolve(path);
        return run("stat", [&]
                   { return do_stat(target); });
    }

    bool ProtocolSession::set_modified_time(const std::string &path, std::int64_t unix_time)
    {
        const auto target = resolve(path);
        return run("set_modified_time", [&]
                   { return do_set_modified_time(target, unix_time); });
    }

    void ProtocolSession::chmod(const std::string &path, std::uint32_t mode)
    {
        const auto target = resolve(path);
        run("chmod", [&]
            { do_chmod(target, mode); });
    }

    void ProtocolSession::ensure_directory(const std::string &path)
    {
        const auto target = resolve(path);
        run("ensure_directory", [&]
            {
                std::string prefix;
                std::size_t start = 1;
                while (start <= target.size())
                {
                    auto end = target.find('/', start);
                    if (end == std::string::npos)
                    {
                        end = target.size();
                    }
                    prefix = target.substr(0, end);
                    start = end + 1;
                    if (prefix.empty() || prefix == "/")
                    {
                        continue;
                    }
                    const auto existing = do_stat(prefix);
                    if (existing)
                    {
                        if (!existing->is_directory())
                        {
                            throw ProtocolError("'" + prefix + "' exists and is not a directory");
                        }
                        continue;
                    }
                    do_mkdir(prefix);
                } });
    }

    void ProtocolSession::close() noexcept
    {
        std::lock_guard lock(mutex_);
        const bool was_connected = connected_.exchange(false);
        do_close();
        if (was_connected)
        {
            spdlog::info("Disconnected from {}", profile_.id);
        }
    }

    std::string ProtocolSession::resolve(const std::string &path) const
    {
        if (!path.empty() && path.front() == '/')
        {
            return normalize_remote(path);
        }
        const auto &base = profile_.initial_path.empty() ? std::string{"/"} : profile_.initial_path;
        return normalize_remote(join_remote(base.front() == '/' ? base : "/" + base, path));
    }

} // namespace skiff::client
