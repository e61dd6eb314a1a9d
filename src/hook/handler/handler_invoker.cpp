#include "handler/handler_invoker.hpp"

#include "event/payload.hpp"
#include "process/subprocess.hpp"

#include <format>
#include <vector>

HandlerInvoker::HandlerInvoker(std::string path, std::chrono::milliseconds timeout,
                               const Tracer& tracer, std::string interpreter)
    : path_(std::move(path)), timeout_(timeout), tracer_(tracer),
      interpreter_(std::move(interpreter)) {}

Verdict HandlerInvoker::invoke(const CanonicalEvent& event) const {
    std::vector<std::string> argv;
    if (!interpreter_.empty()) argv.push_back(interpreter_);
    argv.push_back(path_);

    auto res = subprocess::run(argv, dump_json(event.to_json()), timeout_);
    if (!res) {
        tracer_.log("Handler exception: " + res.error());
        return Verdict::allow();
    }

    if (res->timed_out) {
        tracer_.log(std::format("Handler timeout after {}ms", timeout_.count()));
        return Verdict::allow();
    }

    if (res->exit_code != 0) {
        tracer_.log(std::format("Handler error (exit {}): {}", res->exit_code, res->err));
        return Verdict::allow();
    }

    if (res->out.find_first_not_of(" \t\r\n") == std::string::npos) {
        tracer_.log("Handler produced no output");
        return Verdict::allow();
    }

    auto j = nlohmann::json::parse(res->out, nullptr, false);
    if (j.is_discarded()) {
        tracer_.log("Handler invalid JSON: " + truncate_for_log(res->out));
        return Verdict::allow();
    }

    auto verdict = Verdict::from_json(j);
    if (!verdict) {
        tracer_.log("Handler invalid verdict: " + verdict.error());
        return Verdict::allow();
    }

    return *verdict;
}
