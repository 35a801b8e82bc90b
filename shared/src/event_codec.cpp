#include "skiff/event_codec.hpp"

#include <variant>

namespace skiff
{

    namespace
    {

        void append_payload(nlohmann::json &json, const ConnectionPayload &payload)
        {
            json["profile"] = payload.profile_id;
            if (!payload.reason.empty())
            {
                json["reason"] = payload.reason;
            }
        }

        void append_payload(nlohmann::json &json, const ListingPayload &payload)
        {
            json["profile"] = payload.profile_id;
            json["path"] = payload.path;
            json["entries"] = payload.entries;
            json["skipped"] = payload.skipped_lines;
        }

        void append_payload(nlohmann::json &json, const TaskPayload &payload)
        {
            json["task"] = payload.task;
            json["direction"] = to_string(payload.direction);
            json["local"] = payload.local_path;
            json["remote"] = payload.remote_path;
            json["offset"] = payload.offset;
        }

        void append_payload(nlohmann::json &json, const ProgressPayload &payload)
        {
            json["task"] = payload.task;
            json["bytes_done"] = payload.bytes_done;
            json["bytes_total"] = payload.bytes_total;
        }

        void append_payload(nlohmann::json &json, const FailurePayload &payload)
        {
            json["task"] = payload.task;
            json["error"] = to_string(payload.kind);
            json["reason"] = payload.reason;
            json["attempts"] = payload.attempts;
        }

        void append_payload(nlohmann::json &json, const RetryPayload &payload)
        {
            json["task"] = payload.task;
            json["attempt"] = payload.attempt;
            json["delay_ms"] = payload.delay.count();
            json["error"] = to_string(payload.kind);
            json["reason"] = payload.reason;
        }

        void append_payload(nlohmann::json &json, const PlanSummary &payload)
        {
            json["summary"] = payload;
        }

        void append_payload(nlohmann::json &json, const ConflictPayload &payload)
        {
            json["path"] = payload.path;
            json["local"] = payload.local ? nlohmann::json(*payload.local) : nlohmann::json(nullptr);
            json["remote"] = payload.remote ? nlohmann::json(*payload.remote) : nlohmann::json(nullptr);
            json["reason"] = payload.reason;
        }

        void append_payload(nlohmann::json &json, const SyncPayload &payload)
        {
            json["profile"] = payload.profile_id;
            json["local"] = payload.local_root;
            json["remote"] = payload.remote_root;
            json["done"] = payload.done;
            json["total"] = payload.total;
            json["errors"] = payload.errors;
            if (!payload.reason.empty())
            {
                json["reason"] = payload.reason;
            }
        }

        void append_payload(nlohmann::json &json, const WarningPayload &payload)
        {
            json["task"] = payload.task ? nlohmann::json(*payload.task) : nlohmann::json(nullptr);
            json["message"] = payload.message;
        }

    } // namespace

    void to_json(nlohmann::json &json, const EntryMeta &meta)
    {
        json = nlohmann::json{{"kind", to_string(meta.kind)}, {"size", meta.size}, {"mtime", meta.modified_time}};
    }

    void to_json(nlohmann::json &json, const PlanSummary &summary)
    {
        json = nlohmann::json{{"create_dirs", summary.create_dirs},
                              {"transfers", summary.transfers},
                              {"deletes", summary.deletes},
                              {"conflicts", summary.conflicts},
                              {"bytes", summary.bytes},
                              {"dry_run", summary.dry_run}};
    }

    void to_json(nlohmann::json &json, const Event &event)
    {
        json = nlohmann::json::object();
        json["event"] = to_string(event.kind);
        std::visit([&json](const auto &payload)
                   { append_payload(json, payload); },
                   event.payload);
    }

    std::string encode_event_line(const Event &event)
    {
        // Replace invalid UTF-8 from server listings instead of throwing.
        return nlohmann::json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace skiff
