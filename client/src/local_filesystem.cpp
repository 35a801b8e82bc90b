#include "skiff/client/local_filesystem.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "skiff/errors.hpp"

namespace skiff::client
{

    namespace
    {

        [[noreturn]] void throw_fs_error(const std::string &action, const std::filesystem::path &path,
                                         const std::error_code &ec)
        {
            throw FileSystemError(action + " '" + path.string() + "': " + ec.message());
        }

        [[noreturn]] void throw_fs_error(const std::string &action, const std::filesystem::path &path)
        {
            throw FileSystemError(action + " '" + path.string() + "'");
        }

        std::optional<LocalEntry> entry_from_status(const std::filesystem::path &path,
                                                    const std::filesystem::file_status &status)
        {
            LocalEntry entry;
            entry.path = path;
            if (std::filesystem::is_symlink(status))
            {
                entry.kind = EntryKind::Symlink;
            }
            else if (std::filesystem::is_directory(status))
            {
                entry.kind = EntryKind::Directory;
            }
            else if (std::filesystem::is_regular_file(status))
            {
                entry.kind = EntryKind::File;
            }
            else
            {
                // Sockets, fifos and devices are never transferred.
                return std::nullopt;
            }

            std::error_code ec;
            if (entry.kind == EntryKind::File)
            {
                entry.size = std::filesystem::file_size(path, ec);
                if (ec)
                {
                    throw_fs_error("Cannot read size of", path, ec);
                }
            }
            if (entry.kind != EntryKind::Symlink)
            {
                const auto time = std::filesystem::last_write_time(path, ec);
                if (ec)
                {
                    throw_fs_error("Cannot read modification time of", path, ec);
                }
                entry.modified_time = to_unix_time(time);
            }
            return entry;
        }

    } // namespace

    std::int64_t to_unix_time(std::filesystem::file_time_type time)
    {
        using namespace std::chrono;
        const auto system_time = file_clock::to_sys(time);
        return time_point_cast<seconds>(system_time).time_since_epoch().count();
    }

    std::filesystem::file_time_type from_unix_time(std::int64_t seconds)
    {
        using namespace std::chrono;
        const sys_time<std::chrono::seconds> system_time{std::chrono::seconds(seconds)};
        return time_point_cast<std::filesystem::file_time_type::duration>(file_clock::from_sys(system_time));
    }

    std::vector<LocalEntry> LocalFileSystem::walk(const std::filesystem::path &root) const
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec))
        {
            throw_fs_error("Not a directory", root);
        }

        std::vector<LocalEntry> entries;
        std::filesystem::recursive_directory_iterator it(root, std::filesystem::directory_options::skip_permission_denied,
                                                         ec);
        if (ec)
        {
            throw_fs_error("Cannot walk", root, ec);
        }
        for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec))
        {
            if (ec)
            {
                throw_fs_error("Cannot walk", root, ec);
            }
            const auto status = it->symlink_status(ec);
            if (ec)
            {
                throw_fs_error("Cannot stat", it->path(), ec);
            }
            auto entry = entry_from_status(it->path(), status);
            if (!entry)
            {
                continue;
            }
            entry->relative_path = it->path().lexically_relative(root).generic_string();
            entries.push_back(std::move(*entry));
        }
        if (ec)
        {
            throw_fs_error("Cannot walk", root, ec);
        }

        std::sort(entries.begin(), entries.end(), [](const LocalEntry &lhs, const LocalEntry &rhs)
                  { return lhs.relative_path < rhs.relative_path; });
        return entries;
    }

    std::optional<LocalEntry> LocalFileSystem::stat(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            if (ec && ec != std::errc::no_such_file_or_directory)
            {
                throw_fs_error("Cannot stat", path, ec);
            }
            return std::nullopt;
        }
        auto entry = entry_from_status(path, status);
        if (entry)
        {
            entry->relative_path = path.filename().generic_string();
        }
        return entry;
    }

    std::uint64_t LocalFileSystem::file_size(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw_fs_error("Cannot read size of", path, ec);
        }
        return size;
    }

    std::ifstream LocalFileSystem::open_for_read(const std::filesystem::path &path, std::uint64_t offset) const
    {
        const auto size = file_size(path);
        if (offset > size)
        {
            throw FileSystemError("Resume offset " + std::to_string(offset) + " is beyond the end of '" +
                                  path.string() + "'");
        }
        std::ifstream stream(path, std::ios::binary);
        if (!stream.is_open())
        {
            throw_fs_error("Cannot open for reading", path);
        }
        stream.seekg(static_cast<std::streamoff>(offset));
        if (!stream)
        {
            throw_fs_error("Cannot seek in", path);
        }
        return stream;
    }

    std::ofstream LocalFileSystem::open_for_write(const std::filesystem::path &path, std::uint64_t offset) const
    {
        std::error_code ec;
        if (offset == 0)
        {
            const auto parent = path.parent_path();
            if (!parent.empty())
            {
                std::filesystem::create_directories(parent, ec);
                if (ec)
                {
                    throw_fs_error("Cannot create directory", parent, ec);
                }
            }
            std::ofstream stream(path, std::ios::binary | std::ios::trunc);
            if (!stream.is_open())
            {
                throw_fs_error("Cannot open for writing", path);
            }
            return stream;
        }

        const auto size = file_size(path);
        if (size < offset)
        {
            throw FileSystemError("Partial file '" + path.string() + "' is shorter than the resume offset");
        }
        if (size > offset)
        {
            std::filesystem::resize_file(path, offset, ec);
            if (ec)
            {
                throw_fs_error("Cannot truncate", path, ec);
            }
        }
        std::ofstream stream(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!stream.is_open())
        {
            throw_fs_error("Cannot open for writing", path);
        }
        stream.seekp(static_cast<std::streamoff>(offset));
        if (!stream)
        {
            throw_fs_error("Cannot seek in", path);
        }
        return stream;
    }

    void LocalFileSystem::create_directory(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw_fs_error("Cannot create directory", path, ec);
        }
        if (!std::filesystem::is_directory(path, ec))
        {
            throw_fs_error("Exists and is not a directory", path);
        }
    }

    void LocalFileSystem::remove(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw_fs_error("Cannot remove", path, ec);
        }
    }

    void LocalFileSystem::set_modified_time(const std::filesystem::path &path, std::int64_t unix_time) const
    {
        std::error_code ec;
        std::filesystem::last_write_time(path, from_unix_time(unix_time), ec);
        if (ec)
        {
            throw_fs_error("Cannot set modification time of", path, ec);
        }
    }

} // namespace skiff::client
