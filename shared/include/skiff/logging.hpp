/**
 * Skiff - Process logger setup and log hygiene helpers.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace skiff
{

    struct LogOptions
    {
        std::optional<std::filesystem::path> file{};
        spdlog::level::level_enum level{spdlog::level::info};
        bool console{true};
        // The log file rolls over to file.1, file.2, ... once it reaches max_file_size.
        std::size_t max_file_size{10 * 1024 * 1024};
        std::size_t max_files{5};
    };

    // Installs the default spdlog logger. Safe to call again to reconfigure.
    void init_logging(const LogOptions &options);

    // Throws std::invalid_argument for an unknown level name.
    spdlog::level::level_enum parse_log_level(std::string_view name);

    // Control-channel line with any secret argument masked, for debug logs.
    std::string redact_command(std::string_view line);

} // namespace skiff
