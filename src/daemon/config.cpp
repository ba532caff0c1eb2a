#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
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

        if (j.contains("platform")) cfg.platform = j["platform"].get<std::string>();

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("endpoint")) cfg.backend.endpoint = b["endpoint"].get<std::string>();
            if (b.contains("api_key_env")) cfg.backend.api_key_env = b["api_key_env"].get<std::string>();
            if (b.contains("timeout_ms")) cfg.backend.timeout_ms = b["timeout_ms"].get<uint32_t>();
            if (b.contains("connect_timeout_ms")) cfg.backend.connect_timeout_ms = b["connect_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("hotkeys")) {
            auto& h = j["hotkeys"];
            if (h.contains("quick")) cfg.hotkeys.quick = h["quick"].get<std::string>();
            if (h.contains("deep")) cfg.hotkeys.deep = h["deep"].get<std::string>();
            if (h.contains("debounce_ms")) cfg.hotkeys.debounce_ms = h["debounce_ms"].get<uint32_t>();
            if (h.contains("trigger_command")) cfg.hotkeys.trigger_command = h["trigger_command"].get<std::string>();
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("timeout_ms")) cfg.capture.timeout_ms = c["timeout_ms"].get<uint32_t>();
            if (c.contains("min_text_chars")) cfg.capture.min_text_chars = c["min_text_chars"].get<uint32_t>();
            if (c.contains("quick_ancestor_levels")) cfg.capture.quick_ancestor_levels = c["quick_ancestor_levels"].get<uint32_t>();
            if (c.contains("max_tree_depth")) cfg.capture.max_tree_depth = c["max_tree_depth"].get<uint32_t>();
            if (c.contains("ocr_language")) cfg.capture.ocr_language = c["ocr_language"].get<std::string>();
            if (c.contains("ocr_datapath")) cfg.capture.ocr_datapath = c["ocr_datapath"].get<std::string>();
            if (c.contains("ocr_min_confidence")) cfg.capture.ocr_min_confidence = c["ocr_min_confidence"].get<float>();
        }

        if (j.contains("injection")) {
            auto& i = j["injection"];
            if (i.contains("method")) cfg.injection.method = i["method"].get<std::string>();
            if (i.contains("keystroke_delay_ms")) cfg.injection.keystroke_delay_ms = i["keystroke_delay_ms"].get<uint32_t>();
            if (i.contains("chunk_code_points")) cfg.injection.chunk_code_points = i["chunk_code_points"].get<uint32_t>();
            if (i.contains("max_typed_chars")) cfg.injection.max_typed_chars = i["max_typed_chars"].get<uint32_t>();
            if (i.contains("terminal_apps")) cfg.injection.terminal_apps = i["terminal_apps"].get<std::vector<std::string>>();
        }

        if (j.contains("notifications")) {
            auto& n = j["notifications"];
            if (n.contains("enabled")) cfg.notifications.enabled = n["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.injection.chunk_code_points == 0) cfg.injection.chunk_code_points = 1;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
