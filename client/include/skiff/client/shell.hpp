#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "skiff/client/controller.hpp"
#include "skiff/client/credentials.hpp"
#include "skiff/events.hpp"

namespace skiff::client
{

    class TransferJournal;

    // Line-oriented front end over one profile. Commands are case-insensitive.
    class Shell
    {
    public:
        Shell(Controller &controller, ConnectionProfile profile, StaticCredentialStore &credentials,
              TransferJournal *journal, bool json_events, SyncOptions sync_defaults = {}, std::istream &in = std::cin,
              std::ostream &out = std::cout);
        ~Shell();

        Shell(const Shell &) = delete;
        Shell &operator=(const Shell &) = delete;

        int run();

        // Executes one command line; false when the line asks to leave.
        bool execute(const std::string &line);

    private:
        void connect();
        std::string prompt_password(const std::string &username);
        bool ask_yes_no(const std::string &question);
        void resume_pending_transfers();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void on_event(const Event &event);

        bool handle_list(const std::vector<std::string> &args);
        bool handle_stat(const std::vector<std::string> &args);
        bool handle_cd(const std::vector<std::string> &args);
        bool handle_mkdir(const std::vector<std::string> &args);
        bool handle_remove(const std::vector<std::string> &args, EntryKind kind);
        bool handle_move(const std::vector<std::string> &args);
        bool handle_chmod(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_queue();
        bool handle_task_command(const std::string &command, const std::vector<std::string> &args);
        bool handle_wait(const std::vector<std::string> &args);
        bool handle_sync(const std::vector<std::string> &args);

        void say(const std::string &text);
        void usage(const std::string &text);
        void print_help();
        void print_error(const std::exception &ex);
        std::string resolve_remote_path(const std::string &input) const;
        std::string prompt() const;

        Controller &controller_;
        ConnectionProfile profile_;
        StaticCredentialStore &credentials_;
        TransferJournal *journal_;
        bool json_events_;
        SyncOptions sync_defaults_;
        std::istream &in_;
        std::ostream &out_;
        std::mutex output_mutex_;
        std::string cwd_;
        EventBus::SubscriptionId subscription_{};
    };

} // namespace skiff::client
