#include "detect/ancestry_walker.hpp"

#include "detect/tool_signatures.hpp"

AncestryWalker::AncestryWalker(const ProcessInspector& inspector, int max_depth)
    : inspector_(inspector), max_depth_(max_depth) {}

std::optional<std::string> AncestryWalker::detect(int start_pid) const {
    std::optional<int> pid = start_pid;

    for (int depth = 0; depth < max_depth_; ++depth) {
        if (!pid || *pid <= 1) break;

        auto cmdline = to_lower(inspector_.command_line(*pid));
        if (cmdline.empty()) break;

        if (auto tool = match_signature(cmdline)) return tool;

        pid = inspector_.parent_pid(*pid);
    }
    return std::nullopt;
}

std::vector<ProcessNode> AncestryWalker::trace(int start_pid) const {
    std::vector<ProcessNode> nodes;
    std::optional<int> pid = start_pid;

    for (int depth = 0; depth < max_depth_; ++depth) {
        if (!pid || *pid <= 1) break;

        ProcessNode node{.pid = *pid, .command_line = inspector_.command_line(*pid)};
        node.detected = match_signature(to_lower(node.command_line));
        nodes.push_back(std::move(node));

        pid = inspector_.parent_pid(*pid);
    }
    return nodes;
}
