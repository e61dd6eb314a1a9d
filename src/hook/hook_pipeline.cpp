#include "hook_pipeline.hpp"

#include "detect/ancestry_walker.hpp"
#include "event/payload.hpp"
#include "handler/handler_invoker.hpp"
#include "response/verdict.hpp"

#include <chrono>
#include <format>

HookPipeline::HookPipeline(Config config, Options options, const ProcessInspector& inspector,
                           const Tracer& tracer, int origin_pid)
    : config_(std::move(config)), options_(std::move(options)),
      inspector_(inspector), tracer_(tracer), origin_pid_(origin_pid),
      filter_(config_.filter.noise_markers) {}

std::expected<nlohmann::json, std::string>
HookPipeline::parse_payload(std::string_view input) const {
    if (input.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return nlohmann::json::object();
    }

    bool too_deep = false;
    nlohmann::json::parser_callback_t limit_depth =
        [&too_deep](int depth, nlohmann::json::parse_event_t, nlohmann::json&) {
            if (depth > kMaxPayloadDepth) {
                too_deep = true;
                return false;
            }
            return true;
        };

    auto payload = nlohmann::json::parse(input, limit_depth, false);
    if (too_deep) {
        return std::unexpected(std::format("input JSON nested deeper than {}", kMaxPayloadDepth));
    }
    if (payload.is_discarded()) {
        return std::unexpected(std::string("invalid input JSON"));
    }
    if (!payload.is_object()) {
        return std::unexpected(std::string("input JSON is not an object"));
    }
    return payload;
}

std::string HookPipeline::resolve_source() {
    if (effective_source_) return *effective_source_;

    std::string source = options_.source;
    if (config_.detection.enabled) {
        AncestryWalker walker(inspector_, config_.detection.max_depth);
        auto inferred = walker.detect(origin_pid_);
        if (inferred && *inferred != source) {
            tracer_.log("Source override: " + source + " -> " + *inferred);
            source = *inferred;
        }
    }

    tracer_.log("Effective source: " + source);
    effective_source_ = source;
    return source;
}

nlohmann::json HookPipeline::run(std::string_view input) {
    auto parsed = parse_payload(input);
    bool malformed = !parsed;
    if (malformed) tracer_.log(parsed.error() + ", treating payload as empty");

    auto payload = malformed ? nlohmann::json::object() : std::move(*parsed);
    if (tracer_.enabled()) {
        tracer_.log("Received payload: " + truncate_for_log(dump_json(payload)));
    }

    auto source = resolve_source();

    if (config_.filter.enabled) {
        auto decision = filter_.should_drop(source, payload);
        if (decision.drop) {
            tracer_.log("Event dropped: " + decision.reason);
            return Verdict::allow().to_json();
        }
    }

    auto event = normalize_event(source, payload, options_.event_type);
    if (tracer_.enabled()) {
        tracer_.log("Normalized event: " + truncate_for_log(dump_json(event.to_json())));
    }

    if (options_.normalize_only) {
        return event.to_json();
    }

    if (malformed) {
        tracer_.log("Handler skipped for malformed input");
        return Verdict::allow().to_json();
    }

    if (config_.handler.path.empty()) {
        return Verdict::allow().to_json();
    }

    HandlerInvoker invoker(config_.handler.path,
                           std::chrono::milliseconds(config_.handler.timeout_ms),
                           tracer_, config_.handler.interpreter);
    auto verdict = invoker.invoke(event);
    if (!verdict.allowed()) {
        tracer_.log("Handler denied: " + verdict.reason);
    }
    return verdict.to_json();
}
