#include "response/verdict.hpp"

nlohmann::json Verdict::to_json() const {
    if (decision == Decision::Allow) {
        return {{"hookSpecificOutput", {{"permissionDecision", "allow"}}}, {"continue", true}};
    }
    return {
        {"hookSpecificOutput", {
            {"permissionDecision", "deny"},
            {"permissionDecisionReason", reason},
        }},
        {"continue", false},
    };
}

std::expected<Verdict, std::string> Verdict::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(std::string("verdict is not an object"));
    }

    auto out = j.find("hookSpecificOutput");
    if (out == j.end() || !out->is_object()) {
        return std::unexpected(std::string("missing hookSpecificOutput"));
    }

    auto decision = out->find("permissionDecision");
    if (decision == out->end() || !decision->is_string()) {
        return std::unexpected(std::string("missing permissionDecision"));
    }

    Verdict v;
    auto name = decision->get<std::string>();
    if (name == "allow") {
        v = allow();
    } else if (name == "deny") {
        std::string reason;
        auto r = out->find("permissionDecisionReason");
        if (r != out->end()) {
            if (!r->is_string()) {
                return std::unexpected(std::string("permissionDecisionReason is not a string"));
            }
            reason = r->get<std::string>();
        }
        v = deny(std::move(reason));
    } else {
        return std::unexpected("unknown permissionDecision: " + name);
    }

    auto cont = j.find("continue");
    if (cont != j.end()) {
        if (!cont->is_boolean()) {
            return std::unexpected(std::string("continue is not a boolean"));
        }
        if (cont->get<bool>() != v.allowed()) {
            return std::unexpected("continue contradicts permissionDecision " + name);
        }
    }

    return v;
}
