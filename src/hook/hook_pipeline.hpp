#pragma once

#include "config.hpp"
#include "event/canonical_event.hpp"
#include "event/event_filter.hpp"
#include "options.hpp"
#include "platform/process_inspector.hpp"
#include "trace.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// One hook invocation: payload -> effective source -> filter -> canonical
// event -> handler -> verdict. Internal faults resolve to an allow verdict.
class HookPipeline {
public:
    HookPipeline(Config config, Options options, const ProcessInspector& inspector,
                 const Tracer& tracer, int origin_pid);

    HookPipeline(const HookPipeline&) = delete;
    HookPipeline& operator=(const HookPipeline&) = delete;

    // Returns the JSON document to print on stdout.
    nlohmann::json run(std::string_view input);

    // Claimed source, replaced by the ancestry walk result when detection is
    // enabled and it finds a different tool.
    std::string resolve_source();

    // Nesting deeper than this is rejected as malformed input.
    static constexpr int kMaxPayloadDepth = 512;

    // Empty input is {}. Unparseable, too deeply nested or non-object input
    // is an error; run() then skips the handler and allows.
    std::expected<nlohmann::json, std::string> parse_payload(std::string_view input) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    Options options_;
    const ProcessInspector& inspector_;
    const Tracer& tracer_;
    int origin_pid_;
    EventFilter filter_;
    std::optional<std::string> effective_source_;
};
