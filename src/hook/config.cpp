#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("detection")) {
            auto& d = j["detection"];
            if (d.contains("enabled")) cfg.detection.enabled = d["enabled"].get<bool>();
            if (d.contains("max_depth")) cfg.detection.max_depth = d["max_depth"].get<int>();
        }

        if (j.contains("filter")) {
            auto& fl = j["filter"];
            if (fl.contains("enabled")) cfg.filter.enabled = fl["enabled"].get<bool>();
            if (fl.contains("noise_markers"))
                cfg.filter.noise_markers = fl["noise_markers"].get<std::vector<std::string>>();
        }

        if (j.contains("handler")) {
            auto& h = j["handler"];
            if (h.contains("path")) cfg.handler.path = h["path"].get<std::string>();
            if (h.contains("interpreter")) cfg.handler.interpreter = h["interpreter"].get<std::string>();
            if (h.contains("timeout_ms")) {
                auto ms = h["timeout_ms"].get<int64_t>();
                if (ms <= 0 || ms > std::numeric_limits<uint32_t>::max()) {
                    std::println(stderr, "config: handler.timeout_ms out of range ({}), using {}",
                                 ms, cfg.handler.timeout_ms);
                } else {
                    cfg.handler.timeout_ms = static_cast<uint32_t>(ms);
                }
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}
