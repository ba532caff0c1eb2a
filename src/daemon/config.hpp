#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    // "auto", "sway" or "x11"
    std::string platform = "auto";

    struct Backend {
        std::string url = "http://localhost:8080";
        std::string endpoint = "/v1/reply";
        std::string api_key_env = "REPLY_ANYWHERE_API_KEY";
        uint32_t timeout_ms = 15000;
        uint32_t connect_timeout_ms = 5000;
    } backend;

    struct Hotkeys {
        std::string quick = "ctrl+shift+r";
        std::string deep = "ctrl+shift+e";
        uint32_t debounce_ms = 300;
        // Program sway bindings execute; receives "quick" or "deep".
        std::string trigger_command = "reply-anywhere-ctl";
    } hotkeys;

    struct Capture {
        uint32_t timeout_ms = 2000;
        uint32_t min_text_chars = 30;
        uint32_t quick_ancestor_levels = 2;
        uint32_t max_tree_depth = 40;
        std::string ocr_language = "eng";
        std::string ocr_datapath; // empty: tesseract default
        float ocr_min_confidence = 60.0f;
    } capture;

    struct Injection {
        // "auto", "type" or "paste"
        std::string method = "auto";
        uint32_t keystroke_delay_ms = 8;
        uint32_t chunk_code_points = 16;
        uint32_t max_typed_chars = 2000;
        std::vector<std::string> terminal_apps = {
            "kitty", "alacritty", "foot", "wezterm", "gnome-terminal", "konsole", "xterm"};
    } injection;

    struct Notifications {
        bool enabled = true;
    } notifications;

    static Config load(const std::string& path);
    static Config load_default();
};
