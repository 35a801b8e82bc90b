#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "skiff/client/transfer_task.hpp"

namespace skiff::client
{

    /**
     * JSON file of transfers that have not reached a terminal state, so an
     * interrupted run can offer to pick them up again. Every mutation is
     * written through immediately.
     */
    class TransferJournal
    {
    public:
        struct Entry
        {
            Direction direction{Direction::Download};
            std::string profile_id;
            std::filesystem::path local_path;
            std::string remote_path;
            std::uint64_t total_size{};
            std::uint64_t offset{};
        };

        explicit TransferJournal(std::filesystem::path path = default_path());

        static std::filesystem::path default_path();

        const std::filesystem::path &path() const noexcept { return path_; }

        std::vector<Entry> entries() const;
        std::vector<Entry> pending_for_profile(const std::string &profile_id) const;

        void record(const TransferTask &task);
        void remove(const TransferTask &task);
        void discard_profile(const std::string &profile_id);

    private:
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(Direction direction, const std::string &profile_id,
                                                const std::filesystem::path &local_path, const std::string &remote_path);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path path_;
        mutable std::mutex mutex_;
        std::vector<Entry> entries_;
    };

} // namespace skiff::client
