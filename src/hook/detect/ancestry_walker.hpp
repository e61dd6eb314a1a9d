#pragma once

#include "platform/process_inspector.hpp"

#include <optional>
#include <string>
#include <vector>

struct ProcessNode {
    int pid = 0;
    std::string command_line;
    std::optional<std::string> detected; // tool matched on this node, if any
};

class AncestryWalker {
public:
    static constexpr int kDefaultMaxDepth = 8;

    explicit AncestryWalker(const ProcessInspector& inspector, int max_depth = kDefaultMaxDepth);

    // Climb from start_pid (normally getppid()) at most max_depth generations.
    // Returns the first tool whose signature appears in an ancestor's command
    // line. Stops early at pid <= 1, an unreadable command line, or a missing
    // parent.
    std::optional<std::string> detect(int start_pid) const;

    // Same traversal without stopping on a match, for --debug-tree.
    std::vector<ProcessNode> trace(int start_pid) const;

private:
    const ProcessInspector& inspector_;
    int max_depth_;
};
