#pragma once

#include "config.hpp"
#include "platform/accessibility.hpp"
#include "platform/clipboard.hpp"
#include "platform/hotkey_source.hpp"
#include "platform/keyboard.hpp"
#include "platform/screen_capture.hpp"

#include <expected>
#include <memory>
#include <string>

// The desktop-automation adapter variant picked at startup.
struct PlatformServices {
    std::string name; // "sway" or "x11"
    std::unique_ptr<Accessibility> accessibility;
    std::unique_ptr<ScreenCapture> screen;
    std::unique_ptr<Keyboard> keyboard;
    std::unique_ptr<Clipboard> clipboard;
    std::unique_ptr<HotkeySource> hotkeys;
};

namespace platform {

// Honours config.platform; "auto" picks sway when SWAYSOCK is set and X11
// when DISPLAY is set.
std::expected<PlatformServices, std::string> create_services(const Config& config);

} // namespace platform
