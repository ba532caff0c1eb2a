#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

enum class HotkeyKind { Quick, DeepScan };

enum class TriggerSource { Hotkey, Control };

struct HotkeyEvent {
    HotkeyKind kind = HotkeyKind::Quick;
    std::chrono::steady_clock::time_point pressed_at;
    std::string focused_window; // platform window id at press time, may be empty
    TriggerSource source = TriggerSource::Hotkey;
};

inline std::string_view hotkey_kind_name(HotkeyKind kind) {
    return kind == HotkeyKind::DeepScan ? "deep" : "quick";
}

inline std::optional<HotkeyKind> parse_hotkey_kind(std::string_view name) {
    if (name == "quick") return HotkeyKind::Quick;
    if (name == "deep") return HotkeyKind::DeepScan;
    return std::nullopt;
}
