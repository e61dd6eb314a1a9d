#pragma once

#include "event/canonical_event.hpp"
#include "response/verdict.hpp"
#include "trace.hpp"

#include <chrono>
#include <string>

// Runs an external policy program: the canonical event goes to its stdin as
// JSON, a verdict is expected on its stdout. Fails open: any failure (spawn,
// timeout, non-zero exit, empty or malformed output) yields Verdict::allow().
class HandlerInvoker {
public:
    HandlerInvoker(std::string path, std::chrono::milliseconds timeout, const Tracer& tracer,
                   std::string interpreter = {});

    Verdict invoke(const CanonicalEvent& event) const;

private:
    std::string path_;
    std::chrono::milliseconds timeout_;
    const Tracer& tracer_;
    std::string interpreter_;
};
