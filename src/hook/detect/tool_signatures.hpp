#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ToolSignature {
    std::string_view tool;
    std::vector<std::string_view> patterns; // lowercase substrings
};

// Fixed table in match order: cursor, opencode, gemini, windsurf, zed.
const std::vector<ToolSignature>& tool_signatures();

// First tool (table order) with a pattern contained in an already-lowercased
// command line.
std::optional<std::string> match_signature(std::string_view lowered_cmdline);

// Sources accepted for --source: "claude" plus every tool in the table.
const std::vector<std::string>& known_sources();

bool is_known_source(std::string_view source);

std::string to_lower(std::string s);
