#pragma once

#include "platform/hotkey_source.hpp"
#include "platform/linux/x11_display.hpp"

#include <vector>

// Passive key grabs on the root window. The X connection fd is polled by the
// event loop.
class X11Hotkeys : public HotkeySource {
public:
    X11Hotkeys() = default;
    ~X11Hotkeys() override;

    bool connect();

    std::expected<void, std::string> register_bindings(const HotkeyBindings& bindings) override;
    void unregister_bindings() override;
    int event_fd() const override;
    std::vector<HotkeyPress> read_presses() override;

    static unsigned int modifier_mask(const HotkeyBinding& binding);

private:
    struct Grab {
        HotkeyKind kind;
        unsigned int keycode;
        unsigned int modifiers;
    };

    std::expected<Grab, std::string> grab(const HotkeyBinding& binding, HotkeyKind kind);
    void ungrab(const Grab& g);

    platform::x11::DisplayPtr display_;
    std::vector<Grab> grabs_;
};
