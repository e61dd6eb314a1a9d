#include "platform/linux/procfs_inspector.hpp"

#include "process/subprocess.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

std::string trim(std::string s) {
    constexpr const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<int> parse_int(const std::string& text) {
    auto s = trim(text);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return value;
}

} // namespace

ProcfsInspector::ProcfsInspector(std::chrono::milliseconds ps_timeout)
    : ps_timeout_(ps_timeout) {}

std::string ProcfsInspector::command_line(int pid) const {
    if (pid <= 0) return {};

    if (auto cmdline = read_proc_cmdline(pid)) return *cmdline;
    return ps_field(pid, "command=").value_or("");
}

std::optional<int> ProcfsInspector::parent_pid(int pid) const {
    if (pid <= 1) return std::nullopt;

    auto ppid = read_proc_ppid(pid);
    if (!ppid) {
        auto text = ps_field(pid, "ppid=");
        if (text) ppid = parse_int(*text);
    }

    if (!ppid || *ppid <= 1) return std::nullopt;
    return ppid;
}

std::optional<int> ProcfsInspector::parse_stat_ppid(const std::string& stat) {
    auto last_paren = stat.rfind(')');
    if (last_paren == std::string::npos || last_paren == 0) return std::nullopt;

    std::istringstream rest(stat.substr(last_paren + 1));
    std::string state, ppid;
    if (!(rest >> state >> ppid)) return std::nullopt;
    return parse_int(ppid);
}

std::optional<std::string> ProcfsInspector::read_proc_cmdline(int pid) {
    std::ifstream f(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    std::string raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) return std::nullopt;

    for (auto& c : raw) {
        if (c == '\0') c = ' ';
    }
    return trim(std::move(raw));
}

std::optional<int> ProcfsInspector::read_proc_ppid(int pid) {
    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return std::nullopt;
    std::string stat;
    std::getline(f, stat);
    return parse_stat_ppid(stat);
}

std::optional<std::string> ProcfsInspector::ps_field(int pid, const char* field) const {
    auto res = subprocess::run({"ps", "-p", std::to_string(pid), "-o", field}, "", ps_timeout_);
    if (!res || res->timed_out || res->exit_code != 0) return std::nullopt;
    return trim(res->out);
}
