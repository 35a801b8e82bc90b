#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "skiff/types.hpp"

namespace skiff::client
{

    struct LocalEntry
    {
        // Relative to the walk root, '/' separated.
        std::string relative_path;
        std::filesystem::path path;
        EntryKind kind{EntryKind::File};
        std::uint64_t size{};
        std::int64_t modified_time{};
    };

    /**
     * Local side of every transfer and sync. All failures surface as
     * FileSystemError carrying the offending path.
     */
    class LocalFileSystem
    {
    public:
        virtual ~LocalFileSystem() = default;

        // Recursive, symlinks are reported but not followed. Sorted by relative path.
        virtual std::vector<LocalEntry> walk(const std::filesystem::path &root) const;

        virtual std::optional<LocalEntry> stat(const std::filesystem::path &path) const;

        virtual std::uint64_t file_size(const std::filesystem::path &path) const;

        virtual std::ifstream open_for_read(const std::filesystem::path &path, std::uint64_t offset) const;

        // Offset 0 truncates (creating parent directories); a larger offset keeps
        // exactly the first `offset` bytes and positions the stream after them.
        virtual std::ofstream open_for_write(const std::filesystem::path &path, std::uint64_t offset) const;

        virtual void create_directory(const std::filesystem::path &path) const;

        // Succeeds when the path is already gone. Directories must be empty.
        virtual void remove(const std::filesystem::path &path) const;

        virtual void set_modified_time(const std::filesystem::path &path, std::int64_t unix_time) const;
    };

    std::int64_t to_unix_time(std::filesystem::file_time_type time);
    std::filesystem::file_time_type from_unix_time(std::int64_t seconds);

} // namespace skiff::client
