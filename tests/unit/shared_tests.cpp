#include <array>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skiff/crypto.hpp"
#include "skiff/encoding/base64.hpp"
#include "skiff/error_codes.hpp"
#include "skiff/errors.hpp"
#include "skiff/event_codec.hpp"
#include "skiff/events.hpp"
#include "skiff/logging.hpp"
#include "skiff/types.hpp"
#include "skiff/url.hpp"

#include "test_support.hpp"

using namespace skiff;

void run_ftp_tests();
void run_transfer_tests();
void run_sync_tests();
void run_client_tests();

namespace
{

    void test_url_parsing()
    {
        const auto parsed = parse_connection_url("ftp://u:p@host/inbox");
        assert(parsed.profile.scheme == Scheme::Ftp);
        assert(parsed.profile.tls == TlsMode::None);
        assert(parsed.profile.host == "host");
        assert(parsed.profile.port == 21);
        assert(parsed.profile.username == "u");
        assert(parsed.password == std::optional<std::string>("p"));
        assert(parsed.profile.initial_path == "/inbox");
        assert(parsed.profile.id == "ftp://u@host:21");
        assert(parsed.profile.credential_id == parsed.profile.id);

        const auto implicit = parse_connection_url("ftps://alice@files.example.com");
        assert(implicit.profile.tls == TlsMode::Implicit);
        assert(implicit.profile.port == 990);
        assert(!implicit.password);

        const auto explicit_tls = parse_connection_url("ftps://alice@files.example.com?tls=explicit");
        assert(explicit_tls.profile.tls == TlsMode::Explicit);
        assert(explicit_tls.profile.port == 21);

        const auto sftp = parse_connection_url("sftp://bob:s%40cret@[::1]:2222/home/bob/");
        assert(sftp.profile.scheme == Scheme::Sftp);
        assert(sftp.profile.host == "::1");
        assert(sftp.profile.port == 2222);
        assert(sftp.password == std::optional<std::string>("s@cret"));
        assert(sftp.profile.initial_path == "/home/bob");
        assert(display_url(sftp.profile) == "sftp://bob@[::1]:2222/home/bob");

        const auto anonymous = parse_connection_url("ftp://mirror.example.org/pub");
        assert(anonymous.profile.username == "anonymous");
    }

    void test_url_rejections()
    {
        const std::array<const char *, 6> invalid{
            "http://host/",
            "ftp://",
            "ftp://host:70000",
            "ftp://host:abc",
            "ftp://host?tls=explicit",
            "ftps://host?tls=sometimes",
        };
        for (const auto *url : invalid)
        {
            bool threw = false;
            try
            {
                (void)parse_connection_url(url);
            }
            catch (const ProtocolError &ex)
            {
                threw = true;
                assert(ex.kind() == ErrorKind::Protocol);
            }
            assert(threw);
        }
    }

    void test_remote_paths()
    {
        assert(join_remote("/inbox", "a.txt") == "/inbox/a.txt");
        assert(join_remote("/inbox/", "a.txt") == "/inbox/a.txt");
        assert(join_remote("/inbox", "/abs") == "/abs");
        assert(remote_parent("/inbox/a.txt") == "/inbox");
        assert(remote_parent("/a.txt") == "/");
        assert(remote_basename("/inbox/sub/") == "sub");
        assert(normalize_remote("/inbox/./sub/../a.txt") == "/inbox/a.txt");
        assert(normalize_remote("//x//y/") == "/x/y");
        assert(normalize_remote("") == "/");
    }

    void test_error_taxonomy()
    {
        assert(is_retryable(ErrorKind::Connection));
        assert(is_retryable(ErrorKind::Transfer));
        assert(!is_retryable(ErrorKind::Authentication));
        assert(!is_retryable(ErrorKind::Protocol));
        assert(!is_retryable(ErrorKind::FileSystem));
        assert(to_string(ErrorKind::FileSystem) == "filesystem");
        assert(error_kind_from_string("transfer") == ErrorKind::Transfer);
        assert(!error_kind_from_string("bogus"));

        const UnknownHostKeyError unknown("host", 22, "ssh-ed25519", "SHA256:abc");
        assert(unknown.kind() == ErrorKind::Authentication);
        assert(!unknown.retryable());
        assert(unknown.fingerprint() == "SHA256:abc");
        const TransferError transfer("reset");
        assert(transfer.retryable());
    }

    void test_event_bus()
    {
        EventBus bus;
        std::vector<EventKind> seen;
        std::size_t filtered = 0;
        const auto all = bus.subscribe([&](const Event &event)
                                       { seen.push_back(event.kind); });
        const auto only_warnings = bus.subscribe(EventKind::Warning, [&](const Event &)
                                                 { ++filtered; });
        assert(bus.subscriber_count() == 2);

        bus.publish(Event{EventKind::Connected, ConnectionPayload{"p"}});
        bus.publish(Event{EventKind::Warning, WarningPayload{std::nullopt, "careful"}});
        assert(seen.size() == 2);
        assert(filtered == 1);

        bus.unsubscribe(all);
        bus.publish(Event{EventKind::Warning, WarningPayload{7, "again"}});
        assert(seen.size() == 2);
        assert(filtered == 2);

        // A handler that throws does not stop delivery to the others.
        const auto throwing = bus.subscribe([](const Event &)
                                            { throw std::runtime_error("handler failure"); });
        bus.publish(Event{EventKind::Warning, WarningPayload{std::nullopt, "third"}});
        assert(filtered == 3);
        bus.unsubscribe(throwing);
        bus.unsubscribe(only_warnings);
        assert(bus.subscriber_count() == 0);

        // Subscribing from inside a handler must not deadlock.
        EventBus nested;
        std::size_t inner_calls = 0;
        nested.subscribe([&](const Event &)
                         { nested.subscribe([&](const Event &)
                                            { ++inner_calls; }); });
        nested.publish(Event{EventKind::Connected, ConnectionPayload{"p"}});
        nested.publish(Event{EventKind::Connected, ConnectionPayload{"p"}});
        assert(inner_calls == 1);
    }

    void test_event_names()
    {
        assert(to_string(EventKind::TransferProgress) == "transfer-progress");
        assert(to_string(EventKind::SyncPlanReady) == "sync-plan-ready");
        assert(event_kind_from_string("conflict-detected") == EventKind::ConflictDetected);
        assert(!event_kind_from_string("transfer_progress"));
    }

    void test_event_codec()
    {
        const auto progress = nlohmann::json::parse(
            encode_event_line(Event{EventKind::TransferProgress, ProgressPayload{3, 50, 100}}));
        assert(progress.at("event") == "transfer-progress");
        assert(progress.at("task") == 3);
        assert(progress.at("bytes_done") == 50);
        assert(progress.at("bytes_total") == 100);

        const auto failed = nlohmann::json(
            Event{EventKind::TransferFailed, FailurePayload{4, ErrorKind::Authentication, "denied", 1}});
        assert(failed.at("error") == "authentication");
        assert(failed.at("attempts") == 1);

        RemoteEntry entry;
        entry.path = "/inbox/a.txt";
        entry.name = "a.txt";
        entry.size = 100;
        ListingPayload listing{"ftp://u@host:21", "/inbox", {entry}, 1};
        const auto encoded = nlohmann::json(Event{EventKind::ListingUpdated, listing});
        assert(encoded.at("entries").size() == 1);
        assert(encoded.at("entries")[0].at("size") == 100);
        assert(encoded.at("skipped") == 1);
        assert(encoded.at("entries")[0].get<RemoteEntry>() == entry);

        const auto conflict = nlohmann::json(Event{
            EventKind::ConflictDetected, ConflictPayload{"x.txt", EntryMeta{EntryKind::File, 1, 10}, std::nullopt, "r"}});
        assert(conflict.at("remote").is_null());
        assert(conflict.at("local").at("mtime") == 10);

        PlanSummary summary;
        summary.transfers = 1;
        const auto plan = nlohmann::json(Event{EventKind::SyncPlanReady, summary});
        assert(plan.at("summary").at("transfers") == 1);
        assert(plan.at("summary").at("deletes") == 0);

        const auto line = encode_event_line(Event{EventKind::Warning, WarningPayload{std::nullopt, "bad \xff byte"}});
        assert(line.find('\n') == std::string::npos);
    }

    void test_crypto()
    {
        assert(crypto::constant_time_equals("SHA256:abc", "SHA256:abc"));
        assert(!crypto::constant_time_equals("SHA256:abc", "SHA256:abd"));
        assert(!crypto::constant_time_equals("short", "longer"));

        std::string secret = "hunter2";
        crypto::secure_wipe(secret);
        assert(secret.empty());

        // SHA-256 of the empty string.
        const auto fingerprint = crypto::sha256_fingerprint({});
        assert(fingerprint == "SHA256:47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU");

        const std::array<std::byte, 3> bytes{std::byte{'M'}, std::byte{'a'}, std::byte{'n'}};
        assert(encoding::encode_base64(bytes) == "TWFu");
        assert(encoding::encode_base64(std::span<const std::byte>(bytes.data(), 1)) == "TQ==");
    }

    void test_logging_helpers()
    {
        assert(redact_command("PASS hunter2") == "PASS ****");
        assert(redact_command("pass hunter2") == "pass ****");
        assert(redact_command("USER alice") == "USER alice");
        assert(parse_log_level("debug") == spdlog::level::debug);
        assert(parse_log_level("off") == spdlog::level::off);
        bool threw = false;
        try
        {
            (void)parse_log_level("loud");
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_log_file_rotation()
    {
        test::TempDir dir("log_rotation");
        LogOptions options;
        options.file = dir / "skiff.log";
        options.level = spdlog::level::info;
        options.console = false;
        options.max_file_size = 1024;
        options.max_files = 2;
        init_logging(options);
        for (int i = 0; i < 100; ++i)
        {
            spdlog::info("line {} of a log that outgrows its file", i);
        }
        spdlog::default_logger()->flush();

        assert(std::filesystem::exists(dir / "skiff.log"));
        assert(std::filesystem::exists(dir / "skiff.1.log"));
        assert(std::filesystem::exists(dir / "skiff.2.log"));
        assert(!std::filesystem::exists(dir / "skiff.3.log"));
        assert(std::filesystem::file_size(dir / "skiff.1.log") <= options.max_file_size);

        init_logging(LogOptions{.file = std::nullopt, .level = spdlog::level::warn, .console = true});
    }

} // namespace

int main()
{
    try
    {
        init_logging(LogOptions{.file = std::nullopt, .level = spdlog::level::warn, .console = true});
        test_url_parsing();
        test_url_rejections();
        test_remote_paths();
        test_error_taxonomy();
        test_event_bus();
        test_event_names();
        test_event_codec();
        test_crypto();
        test_logging_helpers();
        test_log_file_rotation();
        run_ftp_tests();
        run_transfer_tests();
        run_sync_tests();
        run_client_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
