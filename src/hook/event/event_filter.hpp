#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct DropDecision {
    bool drop = false;
    std::string reason;
};

// Noise suppression applied after the effective source is known.
//   opencode: always dropped, its own plugin reports these events.
//   cursor:   dropped when cwd or command touches another assistant's private
//             config directory (one of noise_markers).
class EventFilter {
public:
    explicit EventFilter(std::vector<std::string> noise_markers = {".claude"});

    DropDecision should_drop(const std::string& source, const nlohmann::json& payload) const;

    const std::vector<std::string>& noise_markers() const { return noise_markers_; }

private:
    std::vector<std::string> noise_markers_;
};
