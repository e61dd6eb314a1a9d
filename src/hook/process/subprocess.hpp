#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace subprocess {

struct Result {
    int exit_code = -1;     // 128 + signal when killed by a signal
    std::string out;
    std::string err;
    bool timed_out = false;
};

// Run argv[0] (PATH lookup) with stdin_data on its stdin, capturing stdout and
// stderr. On timeout the child's process group is killed and timed_out is set.
// The error branch is only taken when the child could not be spawned or reaped.
std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       const std::string& stdin_data,
                                       std::chrono::milliseconds timeout);

} // namespace subprocess
