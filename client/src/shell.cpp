#include "skiff/client/shell.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

#include "skiff/client/ftp_listing.hpp"
#include "skiff/client/transfer_journal.hpp"
#include "skiff/errors.hpp"
#include "skiff/event_codec.hpp"

namespace skiff::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> std::quoted(token))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::optional<TaskId> parse_task_id(const std::string &text)
        {
            const auto digits = !text.empty() && text.front() == '#' ? text.substr(1) : text;
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
            {
                return std::nullopt;
            }
            return static_cast<TaskId>(std::stoull(digits));
        }

        std::int64_t unix_now()
        {
            using namespace std::chrono;
            return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
        }

    } // namespace

    Shell::Shell(Controller &controller, ConnectionProfile profile, StaticCredentialStore &credentials,
                 TransferJournal *journal, bool json_events, SyncOptions sync_defaults, std::istream &in,
                 std::ostream &out)
        : controller_(controller),
          profile_(std::move(profile)),
          credentials_(credentials),
          journal_(journal),
          json_events_(json_events),
          sync_defaults_(std::move(sync_defaults)),
          in_(in),
          out_(out),
          cwd_(profile_.initial_path)
    {
        subscription_ = controller_.events().subscribe([this](const Event &event)
                                                       { on_event(event); });
    }

    Shell::~Shell()
    {
        controller_.events().unsubscribe(subscription_);
    }

    int Shell::run()
    {
        try
        {
            connect();
            resume_pending_transfers();
        }
        catch (const std::exception &ex)
        {
            print_error(ex);
            spdlog::error("Cannot connect to {}: {}", profile_.id, ex.what());
            return 1;
        }

        while (true)
        {
            {
                std::lock_guard lock(output_mutex_);
                out_ << prompt() << "> " << std::flush;
            }
            std::string line;
            if (!std::getline(in_, line))
            {
                say("");
                break;
            }
            if (!execute(line))
            {
                break;
            }
        }
        controller_.shutdown();
        return 0;
    }

    bool Shell::execute(const std::string &line)
    {
        const auto trimmed = trim(line);
        if (trimmed.empty())
        {
            return true;
        }
        spdlog::debug("command: {}", trimmed);

        const auto tokens = split_tokens(trimmed);
        if (tokens.empty())
        {
            return true;
        }
        const auto command = to_upper(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "EXIT" || command == "QUIT")
        {
            say("OK");
            return false;
        }
        if (command == "HELP")
        {
            print_help();
            return true;
        }

        try
        {
            if (!dispatch(command, args))
            {
                say("ERROR: unsupported_command");
            }
        }
        catch (const std::exception &ex)
        {
            print_error(ex);
            spdlog::warn("{} failed: {}", command, ex.what());
        }
        return true;
    }

    void Shell::connect()
    {
        bool asked_password = false;
        while (true)
        {
            try
            {
                controller_.connect(profile_);
                say("Connected to " + display_url(profile_));
                return;
            }
            catch (const UnknownHostKeyError &ex)
            {
                say("The authenticity of host " + ex.host() + ':' + std::to_string(ex.port()) +
                    " can't be established.");
                say(ex.algorithm() + " key fingerprint is " + ex.fingerprint() + '.');
                if (!ask_yes_no("Trust this host key and continue?"))
                {
                    throw;
                }
                profile_.trust.accepted_host_key = ex.fingerprint();
            }
            catch (const HostKeyMismatchError &)
            {
                say("WARNING: the host key for " + profile_.host + " has changed. Refusing to connect.");
                throw;
            }
            catch (const AuthenticationError &)
            {
                if (asked_password)
                {
                    throw;
                }
                asked_password = true;
                credentials_.put(profile_.credential_id, Secret(prompt_password(profile_.username)));
            }
        }
    }

    std::string Shell::prompt_password(const std::string &username)
    {
        std::string password;
        {
            std::lock_guard lock(output_mutex_);
            out_ << "Password for " << username << ": " << std::flush;
        }
        std::getline(in_, password);
        return password;
    }

    bool Shell::ask_yes_no(const std::string &question)
    {
        while (true)
        {
            {
                std::lock_guard lock(output_mutex_);
                out_ << question << " (y/n): " << std::flush;
            }
            std::string answer;
            if (!std::getline(in_, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            say("Please answer y or n.");
        }
    }

    void Shell::resume_pending_transfers()
    {
        if (!journal_)
        {
            return;
        }
        const auto pending = journal_->pending_for_profile(profile_.id);
        if (pending.empty())
        {
            return;
        }
        if (!ask_yes_no("Incomplete uploads/downloads detected, resume?"))
        {
            journal_->discard_profile(profile_.id);
            return;
        }
        for (const auto &entry : pending)
        {
            const auto id = controller_.enqueue_transfer(
                TransferRequest{entry.direction, profile_, entry.local_path, entry.remote_path, entry.offset});
            say("> " + to_upper(std::string(to_string(entry.direction))) + ' ' + entry.remote_path + " #" +
                std::to_string(id));
        }
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "LIST" || command == "LS")
        {
            return handle_list(args);
        }
        if (command == "STAT")
        {
            return handle_stat(args);
        }
        if (command == "CD")
        {
            return handle_cd(args);
        }
        if (command == "MKDIR")
        {
            return handle_mkdir(args);
        }
        if (command == "RMDIR")
        {
            return handle_remove(args, EntryKind::Directory);
        }
        if (command == "DELETE")
        {
            return handle_remove(args, EntryKind::File);
        }
        if (command == "MOVE")
        {
            return handle_move(args);
        }
        if (command == "CHMOD")
        {
            return handle_chmod(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "QUEUE")
        {
            return handle_queue();
        }
        if (command == "PAUSE" || command == "RESUME" || command == "CANCEL" || command == "RETRY")
        {
            return handle_task_command(command, args);
        }
        if (command == "CLEAR")
        {
            if (args.empty())
            {
                say("OK " + std::to_string(controller_.transfers().clear_finished()) + " removed");
                return true;
            }
            return handle_task_command(command, args);
        }
        if (command == "WAIT")
        {
            return handle_wait(args);
        }
        if (command == "SYNC")
        {
            return handle_sync(args);
        }
        if (command == "DISCONNECT")
        {
            controller_.disconnect(profile_.id);
            say("OK");
            return true;
        }
        return false;
    }

    void Shell::on_event(const Event &event)
    {
        if (json_events_)
        {
            say(encode_event_line(event));
            return;
        }
        std::ostringstream line;
        switch (event.kind)
        {
        case EventKind::TransferCompleted:
        {
            const auto &task = std::get<TaskPayload>(event.payload);
            line << "[#" << task.task << "] done " << task.remote_path;
            break;
        }
        case EventKind::TransferFailed:
        {
            const auto &failure = std::get<FailurePayload>(event.payload);
            line << "[#" << failure.task << "] failed (" << to_string(failure.kind) << "): " << failure.reason;
            break;
        }
        case EventKind::TransferRetrying:
        {
            const auto &retry = std::get<RetryPayload>(event.payload);
            line << "[#" << retry.task << "] retry " << retry.attempt << " in " << retry.delay.count() << " ms: "
                 << retry.reason;
            break;
        }
        case EventKind::TransferPaused:
        {
            const auto &task = std::get<TaskPayload>(event.payload);
            line << "[#" << task.task << "] paused at " << task.offset << " bytes";
            break;
        }
        case EventKind::TransferCancelled:
        {
            const auto &task = std::get<TaskPayload>(event.payload);
            line << "[#" << task.task << "] cancelled";
            break;
        }
        case EventKind::ConflictDetected:
        {
            const auto &conflict = std::get<ConflictPayload>(event.payload);
            line << "[conflict] " << conflict.path << ": " << conflict.reason;
            break;
        }
        case EventKind::Warning:
        {
            const auto &warning = std::get<WarningPayload>(event.payload);
            line << "[warning] " << warning.message;
            break;
        }
        case EventKind::Disconnected:
        {
            const auto &connection = std::get<ConnectionPayload>(event.payload);
            if (connection.reason != "connection lost")
            {
                return;
            }
            line << "[disconnected] " << connection.profile_id;
            break;
        }
        default:
            return;
        }
        say(line.str());
    }

    bool Shell::handle_list(const std::vector<std::string> &args)
    {
        const auto path = args.empty() ? cwd_ : resolve_remote_path(args[0]);
        const auto listing = controller_.list(profile_, path);
        say("OK");
        const auto now = unix_now();
        for (const auto &entry : listing.entries)
        {
            say(format_list_line(entry, now));
        }
        if (listing.skipped_lines > 0)
        {
            say("(" + std::to_string(listing.skipped_lines) + " unparseable line(s) skipped)");
        }
        return true;
    }

    bool Shell::handle_stat(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            usage("STAT <path>");
            return true;
        }
        const auto path = resolve_remote_path(args[0]);
        const auto entry = controller_.stat(profile_, path);
        if (!entry)
        {
            say("ERROR: not_found");
            return true;
        }
        say("OK");
        say("Path: " + entry->path);
        say("Type: " + std::string(to_string(entry->kind)));
        say("Size: " + std::to_string(entry->size) + " bytes");
        if (entry->modified_time > 0)
        {
            say("Modified: " + format_ftp_timestamp(entry->modified_time) + " UTC");
        }
        if (entry->permissions)
        {
            std::ostringstream mode;
            mode << std::oct << std::setw(4) << std::setfill('0') << *entry->permissions;
            say("Mode: " + mode.str());
        }
        if (entry->link_target)
        {
            say("Target: " + *entry->link_target);
        }
        return true;
    }

    bool Shell::handle_cd(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            usage("CD <path>");
            return true;
        }
        const auto path = resolve_remote_path(args[0]);
        const auto entry = controller_.stat(profile_, path);
        if (!entry || !entry->is_directory())
        {
            say("ERROR: invalid_target");
            say("Remote path is not a directory.");
            return true;
        }
        cwd_ = path;
        say("OK");
        return true;
    }

    bool Shell::handle_mkdir(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            usage("MKDIR <path>");
            return true;
        }
        controller_.mkdir(profile_, resolve_remote_path(args[0]));
        say("OK");
        return true;
    }

    bool Shell::handle_remove(const std::vector<std::string> &args, EntryKind kind)
    {
        if (args.size() != 1)
        {
            usage(kind == EntryKind::Directory ? "RMDIR <path>" : "DELETE <path>");
            return true;
        }
        controller_.remove(profile_, resolve_remote_path(args[0]), kind);
        say("OK");
        return true;
    }

    bool Shell::handle_move(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            usage("MOVE <src> <dst>");
            return true;
        }
        controller_.rename(profile_, resolve_remote_path(args[0]), resolve_remote_path(args[1]));
        say("OK");
        return true;
    }

    bool Shell::handle_chmod(const std::vector<std::string> &args)
    {
        if (args.size() != 2 || args[0].find_first_not_of("01234567") != std::string::npos)
        {
            usage("CHMOD <octal-mode> <path>");
            return true;
        }
        const auto mode = static_cast<std::uint32_t>(std::stoul(args[0], nullptr, 8));
        controller_.chmod(profile_, resolve_remote_path(args[1]), mode);
        say("OK");
        return true;
    }

    bool Shell::handle_upload(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            usage("UPLOAD <local_path> [remote_path]");
            return true;
        }
        const std::filesystem::path local_path(args[0]);
        auto remote_target = args.size() == 2 ? args[1] : local_path.filename().generic_string();
        if (remote_target.empty())
        {
            remote_target = args[0];
        }
        const auto id = controller_.enqueue_transfer(
            TransferRequest{Direction::Upload, profile_, local_path, resolve_remote_path(remote_target), 0});
        say("OK queued #" + std::to_string(id));
        return true;
    }

    bool Shell::handle_download(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            usage("DOWNLOAD <remote_path> [local_path]");
            return true;
        }
        const auto remote_path = resolve_remote_path(args[0]);
        std::filesystem::path local_target;
        if (args.size() == 2)
        {
            local_target = std::filesystem::path(args[1]);
        }
        else
        {
            local_target = std::filesystem::path(remote_basename(remote_path));
            if (local_target.empty())
            {
                local_target = std::filesystem::path("downloaded_file");
            }
        }
        const auto id = controller_.enqueue_transfer(
            TransferRequest{Direction::Download, profile_, local_target, remote_path, 0});
        say("OK queued #" + std::to_string(id));
        return true;
    }

    bool Shell::handle_queue()
    {
        const auto tasks = controller_.transfers().tasks();
        say("OK");
        for (const auto &task : tasks)
        {
            std::ostringstream line;
            line << '#' << task.id << ' ' << std::left << std::setw(9) << to_string(task.state) << ' '
                 << to_string(task.direction) << ' ' << task.remote_path << ' ' << task.offset << '/'
                 << task.total_size;
            if (task.retry_pending)
            {
                line << " (retry pending)";
            }
            if (!task.last_error.empty())
            {
                line << " last error: " << task.last_error;
            }
            say(line.str());
        }
        const auto stats = controller_.transfers().stats();
        say(std::to_string(stats.queued) + " queued, " + std::to_string(stats.active) + " active, " +
            std::to_string(stats.paused) + " paused, " + std::to_string(stats.completed) + " completed, " +
            std::to_string(stats.failed) + " failed, " + std::to_string(stats.cancelled) + " cancelled");
        return true;
    }

    bool Shell::handle_task_command(const std::string &command, const std::vector<std::string> &args)
    {
        const auto id = args.size() == 1 ? parse_task_id(args[0]) : std::nullopt;
        if (!id)
        {
            usage(command + " <task-id>");
            return true;
        }
        bool accepted = false;
        if (command == "PAUSE")
        {
            accepted = controller_.pause(*id);
        }
        else if (command == "RESUME")
        {
            accepted = controller_.resume(*id);
        }
        else if (command == "CANCEL")
        {
            accepted = controller_.cancel(*id);
        }
        else if (command == "CLEAR")
        {
            accepted = controller_.remove_transfer(*id);
        }
        else
        {
            accepted = controller_.retry(*id);
        }
        say(accepted ? "OK" : "ERROR: invalid_state");
        return true;
    }

    bool Shell::handle_wait(const std::vector<std::string> &args)
    {
        std::chrono::seconds timeout{3600};
        if (!args.empty())
        {
            timeout = std::chrono::seconds(std::stoll(args[0]));
        }
        say(controller_.transfers().wait_idle(timeout) ? "OK" : "ERROR: timeout");
        return true;
    }

    bool Shell::handle_sync(const std::vector<std::string> &args)
    {
        if (args.size() < 2)
        {
            usage("SYNC <local> <remote> [--direction upload|download|bidirectional] "
                  "[--policy newer-wins|always-download|always-upload|skip-and-report] [--dry-run] [--delete] "
                  "[--include PATTERN] [--exclude PATTERN]");
            return true;
        }
        auto options = sync_defaults_;
        for (std::size_t i = 2; i < args.size(); ++i)
        {
            const auto &flag = args[i];
            const bool has_value = i + 1 < args.size();
            if (flag == "--direction" && has_value)
            {
                const auto direction = sync_direction_from_string(args[++i]);
                if (!direction)
                {
                    usage("--direction upload|download|bidirectional");
                    return true;
                }
                options.direction = *direction;
            }
            else if (flag == "--policy" && has_value)
            {
                const auto policy = conflict_policy_from_string(args[++i]);
                if (!policy)
                {
                    usage("--policy newer-wins|always-download|always-upload|skip-and-report");
                    return true;
                }
                options.policy = *policy;
            }
            else if (flag == "--include" && has_value)
            {
                options.include.push_back(args[++i]);
            }
            else if (flag == "--exclude" && has_value)
            {
                options.exclude.push_back(args[++i]);
            }
            else if (flag == "--dry-run")
            {
                options.dry_run = true;
            }
            else if (flag == "--delete")
            {
                options.delete_extraneous = true;
            }
            else
            {
                say("ERROR: invalid_usage");
                say("Unknown sync option " + flag);
                return true;
            }
        }

        const std::filesystem::path local_root(args[0]);
        const auto remote_root = resolve_remote_path(args[1]);
        const auto plan = controller_.plan_sync(profile_, local_root, remote_root, options);
        for (const auto &action : plan.actions())
        {
            say("  " + std::string(to_string(action.kind)) + ' ' + action.relative_path + " (" +
                std::string(to_string(action.reason)) + ')');
        }
        if (options.dry_run)
        {
            say("OK dry run, " + std::to_string(plan.actions().size()) + " action(s)");
            return true;
        }
        const auto report = controller_.apply_sync(profile_, plan);
        std::ostringstream summary;
        summary << "OK " << report.tasks.size() << " transfer(s) queued, " << report.directories_created
                << " director(ies) created, " << report.deleted << " deleted, " << report.conflicts
                << " conflict(s)";
        say(summary.str());
        for (const auto &error : report.errors)
        {
            say("  error: " + error);
        }
        return true;
    }

    void Shell::say(const std::string &text)
    {
        std::lock_guard lock(output_mutex_);
        out_ << text << std::endl;
    }

    void Shell::usage(const std::string &text)
    {
        say("ERROR: invalid_usage");
        say("Usage: " + text);
    }

    void Shell::print_help()
    {
        say("Available commands:");
        say("  HELP                       Show this help");
        say("  EXIT                       Disconnect and exit");
        say("  LIST [path]                List directory contents");
        say("  STAT <path>                Show metadata for a path");
        say("  CD <path>                  Change current remote directory");
        say("  MKDIR <path>               Create a directory");
        say("  RMDIR <path>               Remove an empty directory");
        say("  DELETE <path>              Delete a file");
        say("  MOVE <src> <dst>           Move or rename an entry");
        say("  CHMOD <mode> <path>        Change permission bits (octal)");
        say("  UPLOAD <local> [remote]    Queue an upload");
        say("  DOWNLOAD <remote> [local]  Queue a download");
        say("  QUEUE                      Show transfers");
        say("  PAUSE|RESUME|CANCEL|RETRY <id>");
        say("  CLEAR [id]                 Forget one or all finished transfers");
        say("  WAIT [seconds]             Wait until the queue is idle");
        say("  SYNC <local> <remote> [options]");
        say("  DISCONNECT                 Close idle sessions");
    }

    void Shell::print_error(const std::exception &ex)
    {
        if (const auto *error = dynamic_cast<const Error *>(&ex))
        {
            say("ERROR: " + std::string(to_string(error->kind())));
        }
        else
        {
            say("ERROR: internal");
        }
        say(ex.what());
    }

    std::string Shell::resolve_remote_path(const std::string &input) const
    {
        if (input.empty())
        {
            return cwd_;
        }
        if (input.front() == '/')
        {
            return normalize_remote(input);
        }
        return normalize_remote(join_remote(cwd_, input));
    }

    std::string Shell::prompt() const
    {
        return profile_.username + '@' + profile_.host + ':' + cwd_;
    }

} // namespace skiff::client
