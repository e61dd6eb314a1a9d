#include "trace.hpp"

#include <cstdio>
#include <cstdlib>
#include <print>

Tracer::Tracer(bool enabled, std::string log_file)
    : enabled_(enabled), log_file_(std::move(log_file)) {}

Tracer Tracer::from_env() {
    const char* debug = std::getenv("HOOK_DEBUG");
    const char* file = std::getenv("HOOK_LOG_FILE");
    return Tracer(debug && std::string_view(debug) == "1", file ? file : "");
}

void Tracer::log(std::string_view msg) const {
    if (!enabled_) return;

    if (!log_file_.empty()) {
        if (FILE* f = std::fopen(log_file_.c_str(), "a")) {
            std::println(f, "[hook-unify] {}", msg);
            std::fclose(f);
            return;
        }
    }
    std::println(stderr, "[hook-unify] {}", msg);
}

std::string truncate_for_log(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}
