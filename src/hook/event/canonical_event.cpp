#include "event/canonical_event.hpp"

#include "event/payload.hpp"

nlohmann::json CanonicalEvent::to_json() const {
    return {
        {"event_type", event_type},
        {"source", source},
        {"session_id", session_id},
        {"cwd", cwd},
        {"tool_name", tool_name},
        {"tool_input", tool_input},
        {"timestamp", timestamp},
        {"raw_payload", raw_payload},
    };
}

CanonicalEvent normalize_event(const std::string& source, const nlohmann::json& payload,
                               const std::string& event_type) {
    CanonicalEvent event;
    event.event_type = event_type;
    event.source = source;
    event.session_id = string_field(payload, "session_id");
    event.cwd = extract_cwd(payload);
    event.timestamp = string_field(payload, "timestamp");
    event.raw_payload = payload;

    event.tool_name = string_field(payload, "tool_name");
    if (event.tool_name.empty()) event.tool_name = string_field(payload, "tool");

    if (payload.is_object()) {
        if (payload.contains("tool_input")) {
            event.tool_input = payload["tool_input"];
        } else if (payload.contains("args")) {
            event.tool_input = payload["args"];
        }
    }

    return event;
}
