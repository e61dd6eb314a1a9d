#include "options.hpp"

#include "detect/tool_signatures.hpp"

#include <print>

void Options::apply_to(Config& cfg) const {
    if (no_detect) cfg.detection.enabled = false;
    if (no_filter) cfg.filter.enabled = false;
    if (!handler.empty()) cfg.handler.path = handler;
}

std::expected<Options, std::string> parse_options(int argc, const char* const argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (arg == "--source") {
            if (!value(opts.source)) return std::unexpected("--source requires a value");
            if (!is_known_source(opts.source)) {
                return std::unexpected("unknown source: " + opts.source);
            }
        } else if (arg == "--event-type") {
            if (!value(opts.event_type) || opts.event_type.empty())
                return std::unexpected("--event-type requires a value");
        } else if (arg == "--handler") {
            if (!value(opts.handler) || opts.handler.empty())
                return std::unexpected("--handler requires a path");
        } else if (arg == "--config" || arg == "-c") {
            if (!value(opts.config_path)) return std::unexpected(arg + " requires a path");
        } else if (arg == "--no-detect") {
            opts.no_detect = true;
        } else if (arg == "--no-filter") {
            opts.no_filter = true;
        } else if (arg == "--normalize-only") {
            opts.normalize_only = true;
        } else if (arg == "--debug-tree") {
            opts.debug_tree = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected("unknown option: " + arg);
        }
    }

    return opts;
}

void print_usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] < payload.json", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  --source NAME       Claimed source tool (default: claude)");
    std::println(stderr, "  --event-type NAME   Event type label (default: PreToolUse)");
    std::println(stderr, "  --handler PATH      External handler receiving the normalized event");
    std::println(stderr, "  --no-detect         Disable source detection from the process tree");
    std::println(stderr, "  --no-filter         Disable noise event filtering");
    std::println(stderr, "  --normalize-only    Print the normalized event instead of a verdict");
    std::println(stderr, "  --debug-tree        Print the inspected process ancestry and exit");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -h, --help          Show this help");
    std::println(stderr, "Environment:");
    std::println(stderr, "  HOOK_DEBUG=1        Trace to stderr");
    std::println(stderr, "  HOOK_LOG_FILE=PATH  Append trace to PATH instead");
}
