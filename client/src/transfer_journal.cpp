#include "skiff/client/transfer_journal.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skiff/errors.hpp"

namespace skiff::client
{

    TransferJournal::TransferJournal(std::filesystem::path path) : path_(std::move(path))
    {
        load();
    }

    std::filesystem::path TransferJournal::default_path()
    {
        if (const char *state = std::getenv("XDG_STATE_HOME"); state && *state)
        {
            return std::filesystem::path(state) / "skiff" / "transfers.json";
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".local" / "state" / "skiff" / "transfers.json";
        }
        return std::filesystem::path(".skiff") / "transfers.json";
    }

    std::vector<TransferJournal::Entry> TransferJournal::entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::vector<TransferJournal::Entry> TransferJournal::pending_for_profile(const std::string &profile_id) const
    {
        std::lock_guard lock(mutex_);
        std::vector<Entry> result;
        for (const auto &entry : entries_)
        {
            if (entry.profile_id == profile_id)
            {
                result.push_back(entry);
            }
        }
        return result;
    }

    void TransferJournal::record(const TransferTask &task)
    {
        std::lock_guard lock(mutex_);
        const auto local = normalize_path(task.local_path);
        auto it = find_entry(task.direction, task.profile_id, local, task.remote_path);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{task.direction, task.profile_id, local, task.remote_path, task.total_size,
                                     task.offset});
        }
        else
        {
            it->total_size = task.total_size;
            it->offset = task.offset;
        }
        save();
    }

    void TransferJournal::remove(const TransferTask &task)
    {
        std::lock_guard lock(mutex_);
        auto it = find_entry(task.direction, task.profile_id, normalize_path(task.local_path), task.remote_path);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    void TransferJournal::discard_profile(const std::string &profile_id)
    {
        std::lock_guard lock(mutex_);
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                      { return entry.profile_id == profile_id; }),
                       entries_.end());
        save();
    }

    void TransferJournal::load()
    {
        entries_.clear();
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            return;
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            throw FileSystemError("cannot open transfer journal " + path_.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            spdlog::warn("Ignoring malformed transfer journal {}", path_.string());
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            const auto direction = direction_from_string(item.value("direction", std::string{}));
            Entry entry;
            entry.profile_id = item.value("profile", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.remote_path = item.value("remote", std::string{});
            entry.total_size = item.value("total", std::uint64_t{0});
            entry.offset = item.value("offset", std::uint64_t{0});
            if (!direction || entry.profile_id.empty() || entry.remote_path.empty())
            {
                continue;
            }
            entry.direction = *direction;
            entries_.push_back(std::move(entry));
        }
    }

    void TransferJournal::save() const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"direction", to_string(entry.direction)},
                            {"profile", entry.profile_id},
                            {"local", entry.local_path.generic_string()},
                            {"remote", entry.remote_path},
                            {"total", entry.total_size},
                            {"offset", entry.offset}});
        }
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
        {
            spdlog::warn("Cannot write transfer journal {}", path_.string());
            return;
        }
        out << json.dump(2);
    }

    std::vector<TransferJournal::Entry>::iterator TransferJournal::find_entry(Direction direction,
                                                                              const std::string &profile_id,
                                                                              const std::filesystem::path &local_path,
                                                                              const std::string &remote_path)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.direction == direction && entry.profile_id == profile_id &&
                                     entry.local_path == local_path && entry.remote_path == remote_path; });
    }

    std::filesystem::path TransferJournal::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace skiff::client
