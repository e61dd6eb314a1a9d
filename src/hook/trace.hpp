#pragma once

#include <string>
#include <string_view>

// Debug trace for a single hook invocation. Enabled by HOOK_DEBUG=1; lines go
// to stderr, or are appended to HOOK_LOG_FILE when set. Never writes stdout,
// which belongs to the hook response.
class Tracer {
public:
    Tracer() = default;
    Tracer(bool enabled, std::string log_file);

    static Tracer from_env();

    bool enabled() const { return enabled_; }
    const std::string& log_file() const { return log_file_; }

    void log(std::string_view msg) const;

private:
    bool enabled_ = false;
    std::string log_file_;
};

// First n characters of s, with "..." appended when truncated.
std::string truncate_for_log(const std::string& s, size_t n = 200);
