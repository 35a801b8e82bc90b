#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "skiff/client/config.hpp"
#include "skiff/client/controller.hpp"
#include "skiff/client/credentials.hpp"
#include "skiff/client/protocol_factory.hpp"
#include "skiff/client/shell.hpp"
#include "skiff/client/transfer_journal.hpp"
#include "skiff/errors.hpp"
#include "skiff/logging.hpp"
#include "skiff/url.hpp"
#include "skiff/version.hpp"

namespace
{

    void print_usage()
    {
        std::cerr << "skiff " << skiff::version() << "\n"
                  << "Usage: skiff <scheme://[user[:password]@]host[:port][/path]> [options]\n"
                  << "  --config FILE           JSON configuration file\n"
                  << "  --log FILE              Write the log to FILE\n"
                  << "  --log-level LEVEL       trace, debug, info, warn, error, critical or off\n"
                  << "  --json-events           Print every event as a JSON line\n"
                  << "  --insecure              Do not verify FTPS certificates\n"
                  << "  --accept-host-key FP    Trust an unknown SFTP host key with this fingerprint\n"
                  << "  --concurrency N         Maximum concurrent transfers\n"
                  << "  --journal FILE          Transfer journal location\n";
    }

    int run(const skiff::client::ClientConfig &config)
    {
        using namespace skiff;
        using namespace skiff::client;

        LogOptions log_options;
        log_options.file = config.log_file;
        log_options.level = parse_log_level(config.log_level);
        // Console logging goes to stderr and is replaced by the log file when one is given.
        log_options.console = !config.log_file.has_value();
        init_logging(log_options);
        spdlog::info("skiff {} starting", version());

        auto parsed = parse_connection_url(config.url);
        auto profile = std::move(parsed.profile);
        profile.passive = profile.passive && config.passive;
        profile.trust.verify_certificate = profile.trust.verify_certificate && config.verify_certificates;
        if (config.accept_host_key)
        {
            profile.trust.accepted_host_key = config.accept_host_key;
        }
        if (config.known_hosts)
        {
            profile.trust.known_hosts_path = config.known_hosts;
        }

        StaticCredentialStore credentials;
        if (parsed.password)
        {
            credentials.put(profile.credential_id, Secret(*parsed.password));
            parsed.password->assign(parsed.password->size(), '\0');
        }

        EventBus events;
        TransferJournal journal(config.journal.value_or(TransferJournal::default_path()));

        ControllerOptions controller_options;
        controller_options.max_sessions_per_profile = config.max_sessions_per_profile;
        controller_options.transfers = transfer_options(config);
        Controller controller(make_session_factory(session_options(config), credentials), events, controller_options,
                              &journal);

        SyncOptions sync_defaults;
        sync_defaults.mtime_tolerance = config.mtime_tolerance;

        Shell shell(controller, std::move(profile), credentials, &journal, config.json_events, sync_defaults);
        const auto status = shell.run();
        spdlog::info("skiff exiting with status {}", status);
        return status;
    }

} // namespace

int main(int argc, char *argv[])
{
    skiff::client::ClientConfig config;
    try
    {
        config = skiff::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }

    try
    {
        return run(config);
    }
    catch (const skiff::Error &ex)
    {
        std::cerr << "ERROR: " << skiff::to_string(ex.kind()) << ": " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
