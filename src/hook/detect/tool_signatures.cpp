#include "detect/tool_signatures.hpp"

#include <algorithm>
#include <cctype>

const std::vector<ToolSignature>& tool_signatures() {
    static const std::vector<ToolSignature> table = {
        {"cursor", {"cursor", "/cursor/"}},
        {"opencode", {"opencode", "/opencode/"}},
        {"gemini", {"gemini", "/gemini/"}},
        {"windsurf", {"windsurf", "/windsurf/"}},
        {"zed", {"/zed/", "zed.app"}},
    };
    return table;
}

std::optional<std::string> match_signature(std::string_view lowered_cmdline) {
    for (const auto& sig : tool_signatures()) {
        for (auto pattern : sig.patterns) {
            if (lowered_cmdline.find(pattern) != std::string_view::npos) {
                return std::string(sig.tool);
            }
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& known_sources() {
    static const std::vector<std::string> sources = [] {
        std::vector<std::string> s = {"claude"};
        for (const auto& sig : tool_signatures()) s.emplace_back(sig.tool);
        return s;
    }();
    return sources;
}

bool is_known_source(std::string_view source) {
    return std::ranges::any_of(known_sources(), [&](const auto& s) { return s == source; });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
