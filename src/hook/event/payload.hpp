#pragma once

#include <nlohmann/json.hpp>

#include <string>

// Field lookups over the raw hook payload. Each assistant uses its own shape,
// so every lookup tolerates missing keys, non-object payloads and wrong types.

// cwd -> working_directory -> tool_input.cwd -> "".
std::string extract_cwd(const nlohmann::json& payload);

// tool_input.command -> args.command -> "". Empty commands are skipped.
std::string extract_command(const nlohmann::json& payload);

// payload[key] if it is a string, else "".
std::string string_field(const nlohmann::json& payload, const char* key);

// Serialize for output. Invalid UTF-8 (e.g. from argv) is replaced instead of
// throwing.
std::string dump_json(const nlohmann::json& j, int indent = -1);
