#include "platform/platform_services.hpp"

#include "platform/linux/atspi_reader.hpp"
#include "platform/linux/command_clipboard.hpp"
#include "platform/linux/grim_capture.hpp"
#include "platform/linux/sway_accessibility.hpp"
#include "platform/linux/sway_hotkeys.hpp"
#include "platform/linux/sway_ipc.hpp"
#include "platform/linux/wtype_keyboard.hpp"
#include "platform/linux/x11_accessibility.hpp"
#include "platform/linux/x11_capture.hpp"
#include "platform/linux/x11_hotkeys.hpp"
#include "platform/linux/xtest_keyboard.hpp"

#include <cstdlib>

namespace platform {

namespace {

bool env_set(const char* name) {
    const char* value = std::getenv(name);
    return value && value[0] != '\0';
}

std::expected<PlatformServices, std::string> create_sway(const Config& config) {
    auto sway = std::make_shared<SwayIpc>();
    if (!sway->connect()) return std::unexpected("cannot reach sway (is $SWAYSOCK set?)");

    auto& capture = config.capture;
    PlatformServices services;
    services.name = "sway";
    services.accessibility = std::make_unique<SwayAccessibility>(
        sway, std::make_unique<AtspiReader>(capture.quick_ancestor_levels, capture.max_tree_depth, true));
    services.screen = std::make_unique<GrimCapture>();
    services.keyboard = std::make_unique<WtypeKeyboard>(config.injection.keystroke_delay_ms);
    services.clipboard = std::make_unique<CommandClipboard>(std::vector<std::string>{"wl-copy"});
    services.hotkeys = std::make_unique<SwayHotkeys>(sway, config.hotkeys.trigger_command);
    return services;
}

std::expected<PlatformServices, std::string> create_x11(const Config& config) {
    auto& capture = config.capture;
    auto accessibility = std::make_unique<X11Accessibility>(
        std::make_unique<AtspiReader>(capture.quick_ancestor_levels, capture.max_tree_depth, false));
    auto screen = std::make_unique<X11Capture>();
    auto keyboard = std::make_unique<XTestKeyboard>(config.injection.keystroke_delay_ms);
    auto hotkeys = std::make_unique<X11Hotkeys>();

    if (!accessibility->connect() || !screen->connect() || !keyboard->connect() || !hotkeys->connect()) {
        return std::unexpected("cannot open X display (is $DISPLAY set?)");
    }

    PlatformServices services;
    services.name = "x11";
    services.accessibility = std::move(accessibility);
    services.screen = std::move(screen);
    services.keyboard = std::move(keyboard);
    services.clipboard = std::make_unique<CommandClipboard>(
        std::vector<std::string>{"xclip", "-selection", "clipboard", "-in"});
    services.hotkeys = std::move(hotkeys);
    return services;
}

} // namespace

std::expected<PlatformServices, std::string> create_services(const Config& config) {
    if (config.platform == "sway") return create_sway(config);
    if (config.platform == "x11") return create_x11(config);
    if (config.platform != "auto") {
        return std::unexpected("unknown platform '" + config.platform + "' (expected auto, sway or x11)");
    }

    if (env_set("SWAYSOCK")) return create_sway(config);
    if (env_set("DISPLAY")) return create_x11(config);
    return std::unexpected("no supported desktop session found (need sway or an X11 display)");
}

} // namespace platform
