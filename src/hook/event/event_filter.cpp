#include "event/event_filter.hpp"

#include "event/payload.hpp"

#include <format>

EventFilter::EventFilter(std::vector<std::string> noise_markers)
    : noise_markers_(std::move(noise_markers)) {}

DropDecision EventFilter::should_drop(const std::string& source,
                                      const nlohmann::json& payload) const {
    if (source == "opencode") {
        return {true, "OpenCode events handled by dedicated plugin"};
    }

    if (source == "cursor") {
        auto cwd = extract_cwd(payload);
        auto cmd = extract_command(payload);
        for (const auto& marker : noise_markers_) {
            if (marker.empty()) continue;
            if (cwd.find(marker) != std::string::npos) {
                return {true, std::format("Cursor reading {} directory", marker)};
            }
            if (cmd.find(marker) != std::string::npos) {
                return {true, std::format("Cursor command accessing {}", marker)};
            }
        }
    }

    return {};
}
