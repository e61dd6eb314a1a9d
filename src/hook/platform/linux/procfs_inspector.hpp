#pragma once

#include "platform/process_inspector.hpp"

#include <chrono>
#include <optional>
#include <string>

// Reads /proc/<pid>/{cmdline,stat}, falling back to `ps` when procfs is
// unreadable. All failures are reported as absence.
class ProcfsInspector : public ProcessInspector {
public:
    explicit ProcfsInspector(std::chrono::milliseconds ps_timeout = std::chrono::seconds(1));

    std::string command_line(int pid) const override;
    std::optional<int> parent_pid(int pid) const override;

    // "pid (comm) state ppid ..." -> ppid. comm may contain spaces and parens.
    static std::optional<int> parse_stat_ppid(const std::string& stat);

private:
    static std::optional<std::string> read_proc_cmdline(int pid);
    static std::optional<int> read_proc_ppid(int pid);
    std::optional<std::string> ps_field(int pid, const char* field) const;

    std::chrono::milliseconds ps_timeout_;
};
