#pragma once

#include "config.hpp"

#include <expected>
#include <string>

struct Options {
    std::string source = "claude";
    std::string event_type = "PreToolUse";
    std::string handler;
    std::string config_path;
    bool no_detect = false;
    bool no_filter = false;
    bool normalize_only = false;
    bool debug_tree = false;
    bool help = false;

    // Command-line flags take precedence over the config file.
    void apply_to(Config& cfg) const;
};

// Unknown options, missing values and unknown sources are errors.
std::expected<Options, std::string> parse_options(int argc, const char* const argv[]);

void print_usage(const char* prog);
