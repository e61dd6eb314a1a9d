#include "config.hpp"
#include "detect/ancestry_walker.hpp"
#include "event/payload.hpp"
#include "hook_pipeline.hpp"
#include "options.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "trace.hpp"

#include <iostream>
#include <iterator>
#include <print>
#include <string>
#include <unistd.h>

static int print_tree(const ProcessInspector& inspector, const Config& config) {
    AncestryWalker walker(inspector, config.detection.max_depth);

    std::println("Process tree detection debug:");
    std::println("  Current PID: {}", ::getpid());
    std::println("  Parent PID: {}", ::getppid());
    std::println("");

    auto nodes = walker.trace(::getppid());
    for (size_t i = 0; i < nodes.size(); i++) {
        const auto& n = nodes[i];
        std::println("  [{}] PID {}: {}{}", i, n.pid, n.command_line.substr(0, 60),
                     n.detected ? " <--" : "");
        if (n.detected) std::println("      Detected: {}", *n.detected);
    }

    std::println("");
    auto detected = walker.detect(::getppid());
    std::println("Final detection: {}", detected.value_or("none (defaults to claimed source)"));
    return 0;
}

int main(int argc, char* argv[]) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        std::println(stderr, "hook-unify: {}", opts.error());
        print_usage(argv[0]);
        return 2;
    }
    if (opts->help) {
        print_usage(argv[0]);
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);
    opts->apply_to(config);

    ProcfsInspector inspector;
    if (opts->debug_tree) {
        return print_tree(inspector, config);
    }

    auto tracer = Tracer::from_env();

    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    bool pretty = opts->normalize_only;

    HookPipeline pipeline(std::move(config), std::move(*opts), inspector, tracer, ::getppid());
    auto output = pipeline.run(input);

    std::println("{}", dump_json(output, pretty ? 2 : -1));
    return 0;
}
