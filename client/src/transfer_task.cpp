#include "skiff/client/transfer_task.hpp"

#include <array>

namespace skiff::client
{

    namespace
    {
        struct StateName
        {
            TransferState state;
            std::string_view name;
        };

        constexpr std::array<StateName, 6> kStateNames{{
            {TransferState::Queued, "queued"},
            {TransferState::Active, "active"},
            {TransferState::Paused, "paused"},
            {TransferState::Completed, "completed"},
            {TransferState::Failed, "failed"},
            {TransferState::Cancelled, "cancelled"},
        }};
    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        for (const auto &entry : kStateNames)
        {
            if (entry.state == state)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::optional<TransferState> transfer_state_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kStateNames)
        {
            if (entry.name == value)
            {
                return entry.state;
            }
        }
        return std::nullopt;
    }

} // namespace skiff::client
