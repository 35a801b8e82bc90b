#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "skiff/client/protocol_session.hpp"
#include "skiff/client/transfer_manager.hpp"

namespace skiff::client
{

    struct ClientConfig
    {
        std::string url;
        std::size_t max_concurrent_transfers{3};
        std::size_t max_sessions_per_profile{2};
        std::uint32_t max_retries{3};
        std::chrono::milliseconds retry_backoff_initial{1000};
        std::chrono::milliseconds retry_backoff_max{30000};
        std::chrono::milliseconds progress_interval{250};
        std::size_t chunk_size{64 * 1024};
        std::chrono::milliseconds connect_timeout{30000};
        std::chrono::milliseconds io_timeout{60000};
        std::chrono::seconds mtime_tolerance{2};
        std::optional<std::filesystem::path> known_hosts;
        std::optional<std::filesystem::path> journal;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        bool passive{true};
        bool verify_certificates{true};
        bool json_events{false};
        std::optional<std::string> accept_host_key;
    };

    // Keys match the command line names with underscores; unknown keys are ignored.
    void from_json(const nlohmann::json &json, ClientConfig &config);

    // Overlays the JSON file onto `config`. Throws FileSystemError when unreadable
    // and std::invalid_argument when it is not a JSON object.
    void load_config_file(const std::filesystem::path &path, ClientConfig &config);

    // skiff <url> [--config F] [--log F] [--log-level L] [--json-events] [--insecure]
    //       [--accept-host-key FP] [--concurrency N] [--journal F]
    // The config file is applied first so command line flags win.
    // Throws std::invalid_argument on malformed arguments.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::filesystem::path default_known_hosts_path();

    SessionOptions session_options(const ClientConfig &config);
    TransferManagerOptions transfer_options(const ClientConfig &config);

} // namespace skiff::client
