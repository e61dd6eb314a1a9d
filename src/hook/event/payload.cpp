#include "event/payload.hpp"

#include <optional>

namespace {

std::optional<std::string> find_string(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

const nlohmann::json* find_object(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

} // namespace

std::string extract_cwd(const nlohmann::json& payload) {
    if (auto cwd = find_string(payload, "cwd")) return *cwd;
    if (auto wd = find_string(payload, "working_directory")) return *wd;

    if (auto* tool_input = find_object(payload, "tool_input")) {
        if (auto cwd = find_string(*tool_input, "cwd")) return *cwd;
    }
    return {};
}

std::string extract_command(const nlohmann::json& payload) {
    for (const char* container : {"tool_input", "args"}) {
        auto* obj = find_object(payload, container);
        if (!obj) continue;
        auto cmd = find_string(*obj, "command");
        if (cmd && !cmd->empty()) return *cmd;
    }
    return {};
}

std::string string_field(const nlohmann::json& payload, const char* key) {
    return find_string(payload, key).value_or("");
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
