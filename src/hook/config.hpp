#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Detection {
        bool enabled = true;
        int max_depth = 8;
    } detection;

    struct Filter {
        bool enabled = true;
        // Private config directories of other assistants; a cursor event whose
        // cwd or command contains one of these is noise.
        std::vector<std::string> noise_markers = {".claude"};
    } filter;

    struct Handler {
        std::string path;
        std::string interpreter; // e.g. "python3"; empty runs path directly
        uint32_t timeout_ms = 30000;
    } handler;

    static Config load(const std::string& path);
    static Config load_default();
};
