#include "skiff/logging.hpp"

#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace skiff
{

    namespace
    {

        constexpr std::array<std::string_view, 2> kSecretCommands{"PASS", "ACCT"};

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            if (lhs.size() != rhs.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i)
            {
                if (std::toupper(static_cast<unsigned char>(lhs[i])) != std::toupper(static_cast<unsigned char>(rhs[i])))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    void init_logging(const LogOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (options.file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file->string(), options.max_file_size, options.max_files));
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        auto logger = std::make_shared<spdlog::logger>("skiff", sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }

    spdlog::level::level_enum parse_log_level(std::string_view name)
    {
        const auto level = spdlog::level::from_str(std::string(name));
        // from_str maps unknown names to off, so only accept "off" when asked for explicitly.
        if (level == spdlog::level::off && name != "off")
        {
            throw std::invalid_argument("Unknown log level: " + std::string(name));
        }
        return level;
    }

    std::string redact_command(std::string_view line)
    {
        const auto space = line.find(' ');
        const auto verb = line.substr(0, space);
        for (const auto secret : kSecretCommands)
        {
            if (iequals(verb, secret))
            {
                return std::string(verb) + (space == std::string_view::npos ? "" : " ****");
            }
        }
        return std::string(line);
    }

} // namespace skiff
