#include "skiff/client/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "skiff/errors.hpp"
#include "skiff/logging.hpp"

namespace skiff::client
{

    namespace
    {

        std::optional<std::string> read_option(std::size_t &index, const std::vector<std::string> &args)
        {
            if (index + 1 >= args.size())
            {
                return std::nullopt;
            }
            ++index;
            return args[index];
        }

        std::string require_option(std::size_t &index, const std::vector<std::string> &args)
        {
            const auto &flag = args[index];
            auto value = read_option(index, args);
            if (!value)
            {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return *value;
        }

        template <typename Duration>
        void read_duration(const nlohmann::json &json, const char *key, Duration &target)
        {
            if (json.contains(key))
            {
                target = Duration(json.at(key).get<typename Duration::rep>());
            }
        }

        template <typename Value>
        void read_value(const nlohmann::json &json, const char *key, Value &target)
        {
            if (json.contains(key))
            {
                target = json.at(key).get<Value>();
            }
        }

        template <typename Value>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<Value> &target)
        {
            if (json.contains(key) && !json.at(key).is_null())
            {
                target = json.at(key).get<Value>();
            }
        }

    } // namespace

    void from_json(const nlohmann::json &json, ClientConfig &config)
    {
        read_value(json, "max_concurrent_transfers", config.max_concurrent_transfers);
        read_value(json, "max_sessions_per_profile", config.max_sessions_per_profile);
        read_value(json, "max_retries", config.max_retries);
        read_duration(json, "retry_backoff_initial_ms", config.retry_backoff_initial);
        read_duration(json, "retry_backoff_max_ms", config.retry_backoff_max);
        read_duration(json, "progress_interval_ms", config.progress_interval);
        read_value(json, "chunk_size", config.chunk_size);
        read_duration(json, "connect_timeout_ms", config.connect_timeout);
        read_duration(json, "io_timeout_ms", config.io_timeout);
        read_duration(json, "mtime_tolerance_seconds", config.mtime_tolerance);
        if (json.contains("known_hosts"))
        {
            config.known_hosts = std::filesystem::path(json.at("known_hosts").get<std::string>());
        }
        if (json.contains("journal"))
        {
            config.journal = std::filesystem::path(json.at("journal").get<std::string>());
        }
        if (json.contains("log_file"))
        {
            config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
        }
        read_value(json, "log_level", config.log_level);
        read_value(json, "passive", config.passive);
        read_value(json, "verify_certificates", config.verify_certificates);
        read_value(json, "json_events", config.json_events);
        read_optional(json, "accept_host_key", config.accept_host_key);
    }

    void load_config_file(const std::filesystem::path &path, ClientConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw FileSystemError("cannot open config file " + path.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw std::invalid_argument("config file " + path.string() + " is not a JSON object");
        }
        try
        {
            json.get_to(config);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::invalid_argument("config file " + path.string() + ": " + ex.what());
        }
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        const std::vector<std::string> args(argv + 1, argv + argc);
        ClientConfig config;

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--config")
            {
                load_config_file(require_option(i, args), config);
            }
        }

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_option(i, args));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_option(i, args);
            }
            else if (arg == "--json-events")
            {
                config.json_events = true;
            }
            else if (arg == "--insecure")
            {
                config.verify_certificates = false;
            }
            else if (arg == "--accept-host-key")
            {
                config.accept_host_key = require_option(i, args);
            }
            else if (arg == "--concurrency")
            {
                const auto value = require_option(i, args);
                std::size_t consumed = 0;
                const auto count = std::stoul(value, &consumed);
                if (consumed != value.size() || count == 0)
                {
                    throw std::invalid_argument("--concurrency expects a positive number, got " + value);
                }
                config.max_concurrent_transfers = count;
            }
            else if (arg == "--journal")
            {
                config.journal = std::filesystem::path(require_option(i, args));
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
            else if (config.url.empty())
            {
                config.url = arg;
            }
            else
            {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }

        if (config.url.empty())
        {
            throw std::invalid_argument("Missing connection URL");
        }
        // Validates the name early; logging is configured from the string later.
        parse_log_level(config.log_level);
        return config;
    }

    std::filesystem::path default_known_hosts_path()
    {
        if (const char *config_home = std::getenv("XDG_CONFIG_HOME"); config_home && *config_home)
        {
            return std::filesystem::path(config_home) / "skiff" / "known_hosts";
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".config" / "skiff" / "known_hosts";
        }
        return std::filesystem::path(".skiff") / "known_hosts";
    }

    SessionOptions session_options(const ClientConfig &config)
    {
        SessionOptions options;
        options.connect_timeout = config.connect_timeout;
        options.io_timeout = config.io_timeout;
        options.chunk_size = config.chunk_size == 0 ? 64 * 1024 : config.chunk_size;
        options.known_hosts = config.known_hosts.value_or(default_known_hosts_path());
        return options;
    }

    TransferManagerOptions transfer_options(const ClientConfig &config)
    {
        TransferManagerOptions options;
        options.max_concurrent = config.max_concurrent_transfers;
        options.max_retries = config.max_retries;
        options.backoff_initial = config.retry_backoff_initial;
        options.backoff_max = config.retry_backoff_max;
        options.progress_interval = config.progress_interval;
        return options;
    }

} // namespace skiff::client
