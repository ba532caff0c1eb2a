#pragma once

#include "hotkey/hotkey_event.hpp"

#include <algorithm>
#include <string>

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }

    bool contains(const Rect& other) const {
        if (other.empty()) return true;
        return other.x >= x && other.y >= y &&
               other.x + other.width <= x + width &&
               other.y + other.height <= y + height;
    }

    Rect intersect(const Rect& other) const {
        int left = std::max(x, other.x);
        int top = std::max(y, other.y);
        int right = std::min(x + width, other.x + other.width);
        int bottom = std::min(y + height, other.y + other.height);
        if (right <= left || bottom <= top) return {};
        return {left, top, right - left, bottom - top};
    }

    bool operator==(const Rect&) const = default;
};

// Quick captures the focused control, DeepScan the whole application window.
enum class CaptureScope { FocusedControl, Window };

inline CaptureScope scope_for(HotkeyKind kind) {
    return kind == HotkeyKind::DeepScan ? CaptureScope::Window : CaptureScope::FocusedControl;
}

struct FocusedTarget {
    std::string handle;        // sway container id or X11 window id
    std::string process_name;  // e.g. "telegram-desktop"
    int pid = 0;
    Rect window_bounds;
    Rect control_bounds;       // empty when the control could not be located

    bool empty() const { return handle.empty(); }

    Rect capture_region(CaptureScope scope) const {
        if (scope == CaptureScope::Window) return window_bounds;
        auto clipped = control_bounds.intersect(window_bounds);
        return clipped.empty() ? window_bounds : clipped;
    }
};
