#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "skiff/error_codes.hpp"
#include "skiff/types.hpp"

namespace skiff::client
{

    enum class TransferState : std::uint8_t
    {
        Queued,
        Active,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TransferState state) noexcept;
    std::optional<TransferState> transfer_state_from_string(std::string_view value) noexcept;

    // What a caller hands to TransferManager::enqueue.
    struct TransferRequest
    {
        Direction direction{Direction::Download};
        ConnectionProfile profile;
        std::filesystem::path local_path;
        std::string remote_path;
        // Non-zero to continue an interrupted transfer.
        std::uint64_t offset{};
    };

    struct TransferTask
    {
        TaskId id{};
        Direction direction{Direction::Download};
        std::string profile_id;
        std::filesystem::path local_path;
        std::string remote_path;
        // Bytes of the destination known to be good; the next attempt starts here.
        std::uint64_t offset{};
        std::uint64_t total_size{};
        TransferState state{TransferState::Queued};
        std::uint32_t attempts{};
        // Failed with an automatic retry scheduled.
        bool retry_pending{};
        std::optional<ErrorKind> last_error_kind{};
        std::string last_error{};

        // Failed without a pending retry counts as terminal.
        bool is_terminal() const noexcept
        {
            return state == TransferState::Completed || state == TransferState::Cancelled ||
                   (state == TransferState::Failed && !retry_pending);
        }
    };

    struct TransferStats
    {
        std::size_t queued{};
        std::size_t active{};
        std::size_t paused{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::size_t retrying{};

        std::size_t total() const noexcept { return queued + active + paused + completed + failed + cancelled + retrying; }
    };

} // namespace skiff::client
