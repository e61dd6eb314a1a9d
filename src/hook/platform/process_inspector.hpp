#pragma once

#include <optional>
#include <string>

class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;

    // Full command line of pid, empty if it cannot be read.
    virtual std::string command_line(int pid) const = 0;

    // Parent of pid, nullopt at the init boundary (<= 1) or if unreadable.
    virtual std::optional<int> parent_pid(int pid) const = 0;
};
