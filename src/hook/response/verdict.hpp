#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

enum class Decision { Allow, Deny };

// Hook runner response. Serialized as
//   {"hookSpecificOutput": {"permissionDecision": "allow"}, "continue": true}
//   {"hookSpecificOutput": {"permissionDecision": "deny",
//                           "permissionDecisionReason": "..."}, "continue": false}
struct Verdict {
    Decision decision = Decision::Allow;
    std::string reason; // only meaningful for Deny

    static Verdict allow() { return {}; }
    static Verdict deny(std::string reason) { return {Decision::Deny, std::move(reason)}; }

    bool allowed() const { return decision == Decision::Allow; }

    nlohmann::json to_json() const;
    static std::expected<Verdict, std::string> from_json(const nlohmann::json& j);

    bool operator==(const Verdict&) const = default;
};
