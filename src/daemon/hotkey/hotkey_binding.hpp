#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// A key combination such as "ctrl+shift+r".
struct HotkeyBinding {
    enum Modifier : uint32_t {
        Ctrl = 1u << 0,
        Shift = 1u << 1,
        Alt = 1u << 2,
        Super = 1u << 3,
    };

    uint32_t modifiers = 0;
    std::string key; // lowercase key name, e.g. "r", "f12"

    static std::expected<HotkeyBinding, std::string> parse(std::string_view text);

    // Sway bindsym syntax, e.g. "Ctrl+Shift+r".
    std::string to_sway() const;
    std::string to_string() const;

    bool operator==(const HotkeyBinding&) const = default;
};

struct HotkeyBindings {
    HotkeyBinding quick;
    HotkeyBinding deep;
};
