#pragma once

#include <nlohmann/json.hpp>

#include <string>

// The one shape every assistant's payload is projected into before any
// policy runs. raw_payload is kept verbatim for auditing.
struct CanonicalEvent {
    std::string event_type;
    std::string source;
    std::string session_id;
    std::string cwd;
    std::string tool_name;
    nlohmann::json tool_input = nlohmann::json::object();
    std::string timestamp;
    nlohmann::json raw_payload = nlohmann::json::object();

    nlohmann::json to_json() const;
};

CanonicalEvent normalize_event(const std::string& source, const nlohmann::json& payload,
                               const std::string& event_type = "PreToolUse");
