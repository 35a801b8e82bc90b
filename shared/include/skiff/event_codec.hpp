/**
 * Skiff - JSON encoding of events, one object per event: {"event": "<name>", ...}.
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "skiff/events.hpp"

namespace skiff
{

    void to_json(nlohmann::json &json, const EntryMeta &meta);
    void to_json(nlohmann::json &json, const PlanSummary &summary);
    void to_json(nlohmann::json &json, const Event &event);

    // Single-line JSON suitable for streaming to another process.
    std::string encode_event_line(const Event &event);

} // namespace skiff
